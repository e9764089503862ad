#pragma once
#include "segwal/segment.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace segwal::cli {

// ----------------------------
// Простенький парсер аргументов
// ----------------------------
struct Args {
  std::string dir = "/tmp/segwal";
  uint64_t    segment_bytes = 1024ull * 1024 * 1024;
  spdlog::level::level_enum log_level = spdlog::level::info;

  std::string command;               // demo | write | read | info
  std::vector<std::string> operands;

  bool help = false;
  bool bad  = false;
};

// "64M" -> 67108864; K/M/G суффиксы. nullopt на мусоре и переполнении.
inline std::optional<uint64_t> parse_bytes(std::string_view s) {
  uint64_t mul = 1;
  if (!s.empty()) {
    switch (s.back()) {
      case 'K': case 'k': mul = 1024ull; break;
      case 'M': case 'm': mul = 1024ull * 1024; break;
      case 'G': case 'g': mul = 1024ull * 1024 * 1024; break;
      default: break;
    }
    if (mul != 1) s.remove_suffix(1);
  }
  if (s.empty()) return std::nullopt;

  uint64_t v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
  if (v > std::numeric_limits<uint64_t>::max() / mul) return std::nullopt;
  return v * mul;
}

// from_str молча отдаёт off на неизвестное имя
inline std::optional<spdlog::level::level_enum> parse_log_level(std::string_view s) {
  const auto lvl = spdlog::level::from_str(std::string(s));
  if (lvl == spdlog::level::off && s != "off") return std::nullopt;
  return lvl;
}

// "1:0:2035" -> ChunkPosition
inline std::optional<ChunkPosition> parse_position(std::string_view s) {
  auto p1 = s.find(':');
  auto p2 = s.rfind(':');
  if (p1 == std::string_view::npos || p1 == p2) return std::nullopt;

  auto field = [](std::string_view f, auto& out) {
    auto [p, ec] = std::from_chars(f.data(), f.data() + f.size(), out);
    return !f.empty() && ec == std::errc{} && p == f.data() + f.size();
  };

  ChunkPosition pos;
  if (!field(s.substr(0, p1), pos.segment_id)) return std::nullopt;
  if (!field(s.substr(p1 + 1, p2 - p1 - 1), pos.block_number)) return std::nullopt;
  if (!field(s.substr(p2 + 1), pos.chunk_offset)) return std::nullopt;
  return pos;
}

inline Args parse_args(int argc, const char* const* argv) {
  Args a;
  for (int i=1;i<argc;++i) {
    std::string_view t = argv[i];
    if (t=="-h" || t=="--help") { a.help=true; break; }

    auto need_value = [&](int i)->bool { return (i+1)<argc; };

    if (t=="--dir" && need_value(i)) { a.dir = argv[++i]; continue; }
    if (t=="--segment" && need_value(i)) {
      std::string_view v = argv[++i];
      if (auto n = parse_bytes(v)) a.segment_bytes = *n;
      else { spdlog::error("Bad --segment value: {}", v); a.bad = true; }
      continue;
    }
    if (t=="--log-level" && need_value(i)) {
      std::string_view v = argv[++i];
      if (auto l = parse_log_level(v)) a.log_level = *l;
      else { spdlog::error("Bad --log-level value: {}", v); a.bad = true; }
      continue;
    }

    if (!t.empty() && t.front()=='-') {
      spdlog::warn("Unknown arg: {}", t);
      a.bad = true;
      continue;
    }
    if (a.command.empty()) a.command = std::string(t);
    else a.operands.emplace_back(t);
  }
  if (a.command.empty()) a.bad = true;
  return a;
}

} // namespace segwal::cli
