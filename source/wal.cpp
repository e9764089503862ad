// source/wal.cpp
#include "segwal/wal.hpp"
#include "segwal/error.hpp"
#include "segwal/util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>

namespace segwal {

// --- вспомогательная: id всех сегментов каталога по возрастанию ---
static std::vector<uint32_t> list_segment_ids_sorted(const std::string& dir) {
  std::vector<uint32_t> out;
  DIR* d = ::opendir(dir.c_str());
  if (!d) throw IoError("opendir", dir, errno);

  try {
    errno = 0;
    while (auto* ent = ::readdir(d)) {
      std::string n = ent->d_name;
      if (n == "." || n == "..") continue;

      struct stat st{};
      const auto full = join_path(dir, n);
      if (::stat(full.c_str(), &st) != 0) throw IoError("stat", full, errno);
      if (S_ISDIR(st.st_mode)) continue;

      if (auto id = parse_segment_file_name(n)) out.push_back(*id);
      errno = 0;
    }
    if (errno != 0) throw IoError("readdir", dir, errno);
  } catch (...) {
    ::closedir(d);
    throw;
  }
  ::closedir(d);

  std::sort(out.begin(), out.end());
  return out;
}

Wal::Wal(const WalOptions& opts) : opts_(opts) {
  if (opts_.segment_size == 0) {
    throw InvalidArgumentError("segment_size must be positive");
  }
  ensure_dir(opts_.dir_path);

  const auto ids = list_segment_ids_sorted(opts_.dir_path);

  if (ids.empty()) {
    active_ = std::make_shared<Segment>(opts_.dir_path, INITIAL_SEGMENT_ID);
    active_->restore_cursor(active_->file_size());
    spdlog::info("WAL open: {} (new, active segment {})", opts_.dir_path, active_->id());
    return;
  }

  // максимальный id: активный, остальные только на чтение
  for (size_t i = 0; i + 1 < ids.size(); ++i) {
    older_.emplace(ids[i], std::make_shared<const Segment>(opts_.dir_path, ids[i]));
  }
  active_ = std::make_shared<Segment>(opts_.dir_path, ids.back());
  const uint64_t padded = active_->recover();

  spdlog::info("WAL open: {} (active segment {}, {} older, cursor block={} size={}{})",
               opts_.dir_path, active_->id(), older_.size(),
               active_->block_number(), active_->block_size(),
               padded ? fmt::format(", sealed tail with {} bytes", padded) : std::string{});
}

Wal::~Wal() = default;

bool Wal::is_full(uint64_t delta) const {
  std::shared_lock lk(table_mu_);
  return is_full_locked(delta);
}

bool Wal::is_full_locked(uint64_t delta) const {
  return active_->size() + delta + ChunkConst::CHUNK_HEADER_SIZE > opts_.segment_size;
}

void Wal::rotate_locked() {
  const uint32_t old_id = active_->id();
  if (old_id == UINT32_MAX) {
    throw InvariantViolationError("segment id space exhausted");
  }

  // вытесненный сегмент больше не синкается через Wal::sync()
  active_->sync();
  auto next = std::make_shared<Segment>(opts_.dir_path, old_id + 1);
  next->restore_cursor(next->file_size());

  {
    std::unique_lock lk(table_mu_);
    older_.emplace(old_id, std::move(active_));
    active_ = std::move(next);
  }
  spdlog::info("WAL rotate: segment {} -> {}", old_id, old_id + 1);
}

ChunkPosition Wal::write(std::string_view record) {
  std::lock_guard wl(write_mu_);

  // пустой сегмент не ротируем: крупная запись ляжет в него целиком
  if (active_->size() > 0 && is_full_locked(record.size())) {
    rotate_locked();
  }
  return active_->write(record);
}

std::shared_ptr<const Segment> Wal::find_segment(uint32_t id) const {
  std::shared_lock lk(table_mu_);
  if (active_->id() == id) return active_;
  auto it = older_.find(id);
  if (it == older_.end()) return nullptr;
  return it->second;
}

std::string Wal::read(const ChunkPosition& pos) const {
  auto seg = find_segment(pos.segment_id);
  if (!seg) throw SegmentNotFoundError(pos.segment_id);
  return seg->read(pos.block_number, pos.chunk_offset);
}

void Wal::sync() {
  std::lock_guard wl(write_mu_);
  active_->sync();
}

uint32_t Wal::active_segment_id() const {
  std::shared_lock lk(table_mu_);
  return active_->id();
}

std::vector<uint32_t> Wal::segment_ids() const {
  std::shared_lock lk(table_mu_);
  std::vector<uint32_t> out;
  out.reserve(older_.size() + 1);
  for (const auto& [id, seg] : older_) out.push_back(id);
  out.push_back(active_->id());
  return out;
}

} // namespace segwal
