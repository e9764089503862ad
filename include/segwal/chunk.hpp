#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace segwal {

struct ChunkConst {
  static constexpr uint32_t BLOCK_SIZE        = 32 * 1024;
  static constexpr uint32_t CHUNK_HEADER_SIZE = 7;   // crc32(4) + length(2) + type(1)
  static constexpr uint32_t MAX_PAYLOAD       = BLOCK_SIZE - CHUNK_HEADER_SIZE;
};

enum class ChunkType : uint8_t {
  Full   = 0,
  First  = 1,
  Middle = 2,
  Last   = 3
};

const char* chunk_type_name(ChunkType t) noexcept;

// Чанк, разобранный из буфера блока. payload смотрит в исходный буфер.
struct DecodedChunk {
  uint32_t         checksum;
  uint16_t         length;
  uint8_t          type_tag;   // сырое значение; > 3 означает мусор
  std::string_view payload;

  bool known_type() const noexcept { return type_tag <= static_cast<uint8_t>(ChunkType::Last); }
  ChunkType type() const noexcept { return static_cast<ChunkType>(type_tag); }
  size_t encoded_size() const noexcept { return ChunkConst::CHUNK_HEADER_SIZE + length; }
};

// Layout (little-endian):
//   [0..3] crc32 (ISO-HDLC) over bytes [4..end)
//   [4..5] payload length
//   [6]    chunk type
//   [7..]  payload
void encode_chunk(std::string& out, std::string_view payload, ChunkType type);
std::string encode_chunk(std::string_view payload, ChunkType type);

std::optional<DecodedChunk> decode_chunk(std::string_view bytes);

// crc32 по length/type/payload, как при кодировании
uint32_t chunk_checksum(const DecodedChunk& c);
bool verify_chunk(const DecodedChunk& c);

} // namespace segwal
