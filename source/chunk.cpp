#include "segwal/chunk.hpp"
#include "segwal/error.hpp"
#include "segwal/util.hpp"

namespace segwal {

const char* chunk_type_name(ChunkType t) noexcept {
  switch (t) {
    case ChunkType::Full:   return "full";
    case ChunkType::First:  return "first";
    case ChunkType::Middle: return "middle";
    case ChunkType::Last:   return "last";
  }
  return "unknown";
}

void encode_chunk(std::string& out, std::string_view payload, ChunkType type) {
  if (payload.size() > ChunkConst::MAX_PAYLOAD || payload.size() > UINT16_MAX) {
    throw InvalidArgumentError("chunk payload too large: " + std::to_string(payload.size()));
  }

  const size_t base = out.size();
  out.resize(base + ChunkConst::CHUNK_HEADER_SIZE);
  out.append(payload.data(), payload.size());

  char* h = out.data() + base;
  put_fixed16(h + 4, static_cast<uint16_t>(payload.size()));
  h[6] = static_cast<char>(type);

  // checksum покрывает всё, кроме самого поля checksum
  std::string_view covered(h + 4, 3 + payload.size());
  put_fixed32(h, crc32_iso_hdlc(covered));
}

std::string encode_chunk(std::string_view payload, ChunkType type) {
  std::string out;
  out.reserve(ChunkConst::CHUNK_HEADER_SIZE + payload.size());
  encode_chunk(out, payload, type);
  return out;
}

std::optional<DecodedChunk> decode_chunk(std::string_view bytes) {
  if (bytes.size() < ChunkConst::CHUNK_HEADER_SIZE) return std::nullopt;

  DecodedChunk c{};
  c.checksum = get_fixed32(bytes.data());
  c.length   = get_fixed16(bytes.data() + 4);
  c.type_tag = static_cast<uint8_t>(bytes[6]);

  if (bytes.size() - ChunkConst::CHUNK_HEADER_SIZE < c.length) return std::nullopt;
  c.payload = bytes.substr(ChunkConst::CHUNK_HEADER_SIZE, c.length);
  return c;
}

uint32_t chunk_checksum(const DecodedChunk& c) {
  char hdr[3];
  put_fixed16(hdr, c.length);
  hdr[2] = static_cast<char>(c.type_tag);
  uint32_t crc = crc32_iso_hdlc(std::string_view(hdr, sizeof(hdr)));
  return crc32_iso_hdlc(c.payload, crc);
}

bool verify_chunk(const DecodedChunk& c) {
  return c.checksum == chunk_checksum(c);
}

} // namespace segwal
