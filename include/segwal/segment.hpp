#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <sys/types.h>

#include "segwal/chunk.hpp"

namespace segwal {

struct SegmentConst {
  static constexpr const char* FILE_SUFFIX = ".seg";
  static constexpr int         ID_DIGITS   = 9;
  static constexpr mode_t      FILE_MODE   = 0644;
};

// Адрес первого чанка записи
struct ChunkPosition {
  uint32_t segment_id   = 0;
  uint32_t block_number = 0;
  uint64_t chunk_offset = 0;   // смещение заголовка внутри блока

  bool operator==(const ChunkPosition&) const = default;
};

// имя файла сегмента: 000000001.seg
std::string segment_file_name(uint32_t id);

// nullopt: файл не сегмент (другой суффикс);
// SegmentNameError: суффикс наш, но id не число или не влезает в uint32
std::optional<uint32_t> parse_segment_file_name(std::string_view name);

// Один файл журнала. Файл открыт на append+read, запись режется на чанки
// по блокам BLOCK_SIZE. Дескриптор защищён rwlock: read: shared, write/sync: exclusive.
class Segment {
public:
  Segment(const std::string& dir, uint32_t id);
  ~Segment();

  Segment(const Segment&) = delete;
  Segment& operator=(const Segment&) = delete;

  uint32_t id() const noexcept { return id_; }
  const std::string& path() const noexcept { return path_; }

  // current_block_number * BLOCK_SIZE + current_block_size
  uint64_t size() const;
  uint32_t block_number() const;
  uint32_t block_size() const;

  // длина файла по fstat
  uint64_t file_size() const;

  // курсор из длины файла: block = len / BLOCK_SIZE, size = len % BLOCK_SIZE
  void restore_cursor(uint64_t file_len);

  // Скан файла с начала и восстановление курсора. Недописанный или битый хвост
  // закрывается нулями до конца блока, байты на диске не удаляются.
  // Возвращает число дописанных байт паддинга.
  uint64_t recover();

  ChunkPosition write(std::string_view record);
  std::string read(uint32_t block_number, uint64_t chunk_offset) const;

  void sync();
  void remove();

private:
  void append_chunk_locked(std::string& buf, std::string_view payload, ChunkType type);
  void write_all_locked(std::string_view buf);
  void rollback_locked(uint64_t len);
  uint64_t file_size_locked() const;
  void read_block_locked(uint32_t block, std::string& buf, uint64_t file_len) const;

  uint32_t    id_;
  std::string path_;
  int         fd_ = -1;

  mutable std::shared_mutex mu_;
  uint32_t current_block_number_ = 0;
  uint32_t current_block_size_   = 0;
  bool     broken_ = false;   // нарушен инвариант курсора: записи запрещены
};

} // namespace segwal
