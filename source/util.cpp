#include "segwal/util.hpp"
#include "segwal/error.hpp"

#include <filesystem>
#include <system_error>
#include <zlib.h>

namespace segwal {

void ensure_dir(const std::string& p) {
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec)) return;
  if (std::filesystem::exists(p, ec))
    throw IoError("create_directories", p, std::make_error_code(std::errc::not_a_directory));
  std::filesystem::create_directories(p, ec);
  if (ec) throw IoError("create_directories", p, ec);
}

std::string join_path(std::string a, std::string b) {
  if (!a.empty() && a.back() != '/')
    a.push_back('/');
  a += b;
  return a;
}

uint32_t crc32_iso_hdlc(std::string_view data, uint32_t seed) {
  uLong crc = seed;
  const auto* p = reinterpret_cast<const Bytef*>(data.data());
  size_t left = data.size();
  // zlib принимает uInt, режем на куски
  while (left > 0) {
    const uInt n = left > (1u << 30) ? (1u << 30) : static_cast<uInt>(left);
    crc = ::crc32(crc, p, n);
    p += n;
    left -= n;
  }
  return static_cast<uint32_t>(crc);
}

void put_fixed16(char* dst, uint16_t v) {
  dst[0] = static_cast<char>(v & 0xff);
  dst[1] = static_cast<char>((v >> 8) & 0xff);
}

void put_fixed32(char* dst, uint32_t v) {
  dst[0] = static_cast<char>(v & 0xff);
  dst[1] = static_cast<char>((v >> 8) & 0xff);
  dst[2] = static_cast<char>((v >> 16) & 0xff);
  dst[3] = static_cast<char>((v >> 24) & 0xff);
}

uint16_t get_fixed16(const char* src) {
  const auto* p = reinterpret_cast<const unsigned char*>(src);
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_fixed32(const char* src) {
  const auto* p = reinterpret_cast<const unsigned char*>(src);
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace segwal
