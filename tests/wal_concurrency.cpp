#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "segwal/wal.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <tuple>
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

// содержимое зависит от (поток, номер), чтобы перепутанные записи было видно
static std::string make_record(unsigned tid, unsigned i) {
  const size_t sizes[] = {1, 100, 2028, 9000, 33000, 70000};
  const size_t len = sizes[(tid + i) % 6];
  std::string s = "t" + std::to_string(tid) + "#" + std::to_string(i) + ":";
  s.resize(std::max(len, s.size()), static_cast<char>('a' + (tid * 7 + i) % 26));
  return s;
}

TEST_CASE("WAL: concurrent writers with rotation") {
  auto dir = tmpdir("segwal_conc_w_");
  Wal wal({.dir_path = dir, .segment_size = 256 * 1024});

  constexpr unsigned kThreads = 4;
  constexpr unsigned kPerThread = 60;
  std::vector<std::vector<ChunkPosition>> positions(kThreads);

  std::vector<std::thread> workers;
  for (unsigned t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (unsigned i = 0; i < kPerThread; ++i)
        positions[t].push_back(wal.write(make_record(t, i)));
    });
  }
  for (auto& w : workers) w.join();

  REQUIRE(wal.active_segment_id() > 1);

  std::set<std::tuple<uint32_t, uint32_t, uint64_t>> seen;
  for (unsigned t = 0; t < kThreads; ++t) {
    for (unsigned i = 0; i < kPerThread; ++i) {
      const auto& p = positions[t][i];
      REQUIRE(seen.emplace(p.segment_id, p.block_number, p.chunk_offset).second);
      REQUIRE(wal.read(p) == make_record(t, i));
    }
  }

  // id сегментов непрерывны
  const auto ids = wal.segment_ids();
  for (size_t k = 0; k < ids.size(); ++k) REQUIRE(ids[k] == k + 1);
}

TEST_CASE("WAL: readers run alongside a writer") {
  auto dir = tmpdir("segwal_conc_rw_");
  Wal wal({.dir_path = dir, .segment_size = 128 * 1024});

  // часть записей есть до старта читателей
  std::vector<std::pair<ChunkPosition, std::string>> base;
  for (unsigned i = 0; i < 20; ++i) {
    auto rec = make_record(9, i);
    base.emplace_back(wal.write(rec), rec);
  }

  std::atomic<bool> stop{false};
  std::atomic<uint64_t> mismatches{0};
  std::atomic<uint64_t> reads{0};

  std::vector<std::thread> readers;
  for (unsigned r = 0; r < 3; ++r) {
    readers.emplace_back([&, r] {
      size_t k = r;
      while (!stop.load(std::memory_order_relaxed)) {
        const auto& [pos, rec] = base[k % base.size()];
        if (wal.read(pos) != rec) mismatches.fetch_add(1);
        reads.fetch_add(1);
        ++k;
      }
    });
  }

  std::vector<std::pair<ChunkPosition, std::string>> more;
  for (unsigned i = 0; i < 80; ++i) {
    auto rec = make_record(10, i);
    more.emplace_back(wal.write(rec), rec);
  }
  wal.sync();

  while (reads.load() == 0) std::this_thread::yield();
  stop = true;
  for (auto& t : readers) t.join();

  REQUIRE(mismatches.load() == 0);
  for (const auto& [pos, rec] : more) REQUIRE(wal.read(pos) == rec);
}
