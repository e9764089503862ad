#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace segwal {
void ensure_dir(const std::string& p);
std::string join_path(std::string a, std::string b);

// CRC-32/ISO-HDLC (zlib)
uint32_t crc32_iso_hdlc(std::string_view data, uint32_t seed = 0);

void put_fixed16(char* dst, uint16_t v);
void put_fixed32(char* dst, uint32_t v);
uint16_t get_fixed16(const char* src);
uint32_t get_fixed32(const char* src);
} // namespace segwal
