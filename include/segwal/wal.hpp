#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "segwal/segment.hpp"

namespace segwal {

struct WalOptions {
  std::string dir_path = "/tmp/segwal";
  uint64_t    segment_size = 1024ull * 1024 * 1024;   // бюджет одного сегмента, байт
};

// Логический журнал поверх набора сегментов каталога.
// Активный сегмент принимает записи, старые доступны только на чтение.
class Wal {
public:
  static constexpr uint32_t INITIAL_SEGMENT_ID = 1;

  explicit Wal(const WalOptions& opts);
  ~Wal();

  Wal(const Wal&) = delete;
  Wal& operator=(const Wal&) = delete;

  // Ротация перед записью, если is_full(record.size()); пустой активный
  // сегмент не ротируется, запись больше бюджета ложится в него целиком.
  ChunkPosition write(std::string_view record);
  std::string read(const ChunkPosition& pos) const;
  void sync();

  // active.size() + delta + CHUNK_HEADER_SIZE > segment_size
  bool is_full(uint64_t delta) const;

  uint32_t active_segment_id() const;
  std::vector<uint32_t> segment_ids() const;
  const WalOptions& options() const noexcept { return opts_; }

private:
  bool is_full_locked(uint64_t delta) const;
  void rotate_locked();
  std::shared_ptr<const Segment> find_segment(uint32_t id) const;

  WalOptions opts_;

  // write_mu_: решение о ротации + ротация + append: одна критическая секция.
  // table_mu_: только указатели active_/older_, держится коротко.
  mutable std::mutex        write_mu_;
  mutable std::shared_mutex table_mu_;

  std::shared_ptr<Segment>                         active_;
  std::map<uint32_t, std::shared_ptr<const Segment>> older_;
};

} // namespace segwal
