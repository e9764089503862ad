#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "segwal/wal.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <unistd.h>
#include <vector>

using namespace segwal;
namespace fs = std::filesystem;

static std::string tmpdir(const char* prefix){
  auto d = fs::temp_directory_path() / (std::string(prefix) + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d.string();
}

static std::string random_record(std::mt19937_64& rng, size_t len) {
  std::uniform_int_distribution<int> dist(0, 255);
  std::string s(len, '\0');
  for (auto& ch : s) ch = static_cast<char>(dist(rng));
  return s;
}

TEST_CASE("WAL: chunk headers never start in the last 7 bytes of a block") {
  auto dir = tmpdir("segwal_align_");

  std::mt19937_64 rng(0xC0FFEEULL);
  // размеры подобраны так, чтобы курсор часто подходил к краю блока
  std::uniform_int_distribution<size_t> small(0, 64);
  std::uniform_int_distribution<size_t> medium(1000, 9000);
  std::uniform_int_distribution<size_t> large(30000, 100000);

  std::vector<std::pair<ChunkPosition, std::string>> written;
  {
    Wal wal({.dir_path = dir, .segment_size = 64ull * 1024 * 1024});
    for (int i = 0; i < 120; ++i) {
      size_t len = 0;
      switch (i % 5) {
        case 0: case 1: len = small(rng); break;
        case 2: case 3: len = medium(rng); break;
        default: len = large(rng); break;
      }
      auto rec = random_record(rng, len);
      auto pos = wal.write(rec);
      written.emplace_back(pos, std::move(rec));
    }
    REQUIRE(wal.active_segment_id() == Wal::INITIAL_SEGMENT_ID);

    for (const auto& [pos, rec] : written) {
      REQUIRE(wal.read(pos) == rec);
    }
  }

  const auto path = fs::path(dir) / segment_file_name(1);
  std::ifstream in(path, std::ios::binary);
  const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  constexpr uint32_t BS  = ChunkConst::BLOCK_SIZE;
  constexpr uint32_t HDR = ChunkConst::CHUNK_HEADER_SIZE;

  // проход по файлу: собираем записи по типам чанков
  std::vector<uint64_t> starts;
  std::vector<std::string> records;
  std::string cur;
  bool in_record = false;

  uint64_t off = 0;
  while (off < data.size()) {
    const uint64_t in_block = off % BS;
    if (BS - in_block <= HDR) {
      const uint64_t end = std::min<uint64_t>(off + (BS - in_block), data.size());
      for (uint64_t i = off; i < end; ++i) REQUIRE(data[i] == '\0');
      off = end;
      continue;
    }

    auto c = decode_chunk(std::string_view(data).substr(off));
    REQUIRE(c.has_value());
    REQUIRE(verify_chunk(*c));
    REQUIRE(in_block + c->encoded_size() <= BS);

    switch (c->type()) {
      case ChunkType::Full:
        REQUIRE_FALSE(in_record);
        starts.push_back(off);
        records.emplace_back(c->payload);
        break;
      case ChunkType::First:
        REQUIRE_FALSE(in_record);
        // First всегда дописывает блок до конца
        REQUIRE(in_block + c->encoded_size() == BS);
        starts.push_back(off);
        cur.assign(c->payload);
        in_record = true;
        break;
      case ChunkType::Middle:
        REQUIRE(in_record);
        REQUIRE(in_block == 0);
        REQUIRE(c->encoded_size() == BS);
        cur.append(c->payload);
        break;
      case ChunkType::Last:
        REQUIRE(in_record);
        REQUIRE(in_block == 0);
        cur.append(c->payload);
        records.push_back(std::move(cur));
        cur.clear();
        in_record = false;
        break;
    }
    off += c->encoded_size();
  }
  REQUIRE_FALSE(in_record);

  REQUIRE(records.size() == written.size());
  for (size_t i = 0; i < written.size(); ++i) {
    const auto& pos = written[i].first;
    REQUIRE(starts[i] == static_cast<uint64_t>(pos.block_number) * BS + pos.chunk_offset);
    REQUIRE(records[i] == written[i].second);
  }
}
