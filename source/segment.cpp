// source/segment.cpp
#include "segwal/segment.hpp"
#include "segwal/error.hpp"
#include "segwal/util.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <mutex>

namespace segwal {

namespace {
constexpr uint32_t BS  = ChunkConst::BLOCK_SIZE;
constexpr uint32_t HDR = ChunkConst::CHUNK_HEADER_SIZE;
} // namespace

std::string segment_file_name(uint32_t id) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%09u%s", static_cast<unsigned>(id), SegmentConst::FILE_SUFFIX);
  return std::string(buf);
}

std::optional<uint32_t> parse_segment_file_name(std::string_view name) {
  const std::string_view suffix = SegmentConst::FILE_SUFFIX;
  if (name.size() < suffix.size() || name.substr(name.size() - suffix.size()) != suffix)
    return std::nullopt;

  auto digits = name.substr(0, name.size() - suffix.size());
  if (digits.empty() ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isdigit(c); })) {
    throw SegmentNameError(std::string(name));
  }

  uint32_t id = 0;
  auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
  if (ec != std::errc{} || p != digits.data() + digits.size())
    throw SegmentNameError(std::string(name));
  // "7.seg" открылся бы как другой файл (000000007.seg)
  if (segment_file_name(id) != name)
    throw SegmentNameError(std::string(name));
  return id;
}

Segment::Segment(const std::string& dir, uint32_t id)
  : id_(id), path_(join_path(dir, segment_file_name(id)))
{
  fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, SegmentConst::FILE_MODE);
  if (fd_ < 0) throw IoError("open", path_, errno);

  // umask мог срезать биты, выставляем явно
  if (::fchmod(fd_, SegmentConst::FILE_MODE) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw IoError("fchmod", path_, err);
  }
  spdlog::debug("segment open: {}", path_);
}

Segment::~Segment() {
  if (fd_ >= 0) ::close(fd_);
}

uint64_t Segment::size() const {
  std::shared_lock lk(mu_);
  return static_cast<uint64_t>(current_block_number_) * BS + current_block_size_;
}

uint32_t Segment::block_number() const {
  std::shared_lock lk(mu_);
  return current_block_number_;
}

uint32_t Segment::block_size() const {
  std::shared_lock lk(mu_);
  return current_block_size_;
}

uint64_t Segment::file_size() const {
  std::shared_lock lk(mu_);
  return file_size_locked();
}

uint64_t Segment::file_size_locked() const {
  struct stat st{};
  if (::fstat(fd_, &st) != 0) throw IoError("fstat", path_, errno);
  return static_cast<uint64_t>(st.st_size);
}

void Segment::restore_cursor(uint64_t file_len) {
  std::unique_lock lk(mu_);
  current_block_number_ = static_cast<uint32_t>(file_len / BS);
  current_block_size_   = static_cast<uint32_t>(file_len % BS);
}

void Segment::read_block_locked(uint32_t block, std::string& buf, uint64_t file_len) const {
  const uint64_t off = static_cast<uint64_t>(block) * BS;
  // последний блок файла может быть неполным
  const uint64_t n = std::min<uint64_t>(BS, file_len - off);
  buf.resize(static_cast<size_t>(n));

  size_t done = 0;
  while (done < n) {
    ssize_t r = ::pread(fd_, buf.data() + done, n - done, static_cast<off_t>(off + done));
    if (r < 0) {
      if (errno == EINTR) continue;
      throw IoError("pread", path_, errno);
    }
    if (r == 0) break;   // файл укоротили из-под нас
    done += static_cast<size_t>(r);
  }
  buf.resize(done);
}

uint64_t Segment::recover() {
  std::unique_lock lk(mu_);

  const uint64_t len = file_size_locked();
  const uint64_t nblocks = (len + BS - 1) / BS;

  uint64_t valid_end = 0;     // конец последней целой записи
  uint64_t damaged = 0;       // число битых чанков
  uint64_t first_bad = 0;
  bool in_record = false;

  auto mark_bad = [&](uint64_t off) {
    if (damaged++ == 0) first_bad = off;
    in_record = false;
  };

  std::string buf;
  for (uint64_t b = 0; b < nblocks; ++b) {
    read_block_locked(static_cast<uint32_t>(b), buf, len);
    const uint64_t block_off = b * BS;

    size_t pos = 0;
    while (pos < buf.size()) {
      if (BS - pos <= HDR) break;   // хвост блока под паддинг

      const auto c = decode_chunk(std::string_view(buf).substr(pos));
      if (!c || pos + c->encoded_size() > BS) {
        // длине верить нельзя: остаток блока пропускаем
        mark_bad(block_off + pos);
        break;
      }

      const bool type_ok = c->known_type() &&
        (in_record ? (c->type() == ChunkType::Middle || c->type() == ChunkType::Last)
                   : (c->type() == ChunkType::Full   || c->type() == ChunkType::First));
      if (!type_ok || !verify_chunk(*c)) {
        mark_bad(block_off + pos);
        pos += c->encoded_size();
        continue;
      }

      pos += c->encoded_size();
      if (c->type() == ChunkType::Full || c->type() == ChunkType::Last) {
        in_record = false;
        valid_end = block_off + pos;
      } else {
        in_record = true;
      }
    }
  }

  if (damaged > 0) {
    spdlog::warn("segment {}: {} damaged chunk(s), first at offset {}, left in place",
                 path_, damaged, first_bad);
  }

  // Хвост после последней целой записи не обрезается: на эти смещения могли
  // выдать позиции. Добиваем нулями до границы блока, новые записи идут дальше.
  uint64_t padded = 0;
  if (valid_end < len && len % BS != 0) {
    padded = BS - len % BS;
    write_all_locked(std::string(static_cast<size_t>(padded), '\0'));
    if (::fsync(fd_) != 0) throw IoError("fsync", path_, errno);
    spdlog::warn("segment {}: unfinished tail after offset {}, sealed with {} zero bytes",
                 path_, valid_end, padded);
  }

  const uint64_t new_len = len + padded;
  current_block_number_ = static_cast<uint32_t>(new_len / BS);
  current_block_size_   = static_cast<uint32_t>(new_len % BS);
  return padded;
}

void Segment::append_chunk_locked(std::string& buf, std::string_view payload, ChunkType type) {
  if (current_block_size_ + HDR + payload.size() > BS) {
    broken_ = true;
    throw InvariantViolationError(
      "segment " + path_ + ": chunk exceeds block size (block_size=" +
      std::to_string(current_block_size_) + ", chunk=" +
      std::to_string(HDR + payload.size()) + ")");
  }
  encode_chunk(buf, payload, type);

  current_block_size_ += HDR + static_cast<uint32_t>(payload.size());
  if (current_block_size_ == BS) {
    ++current_block_number_;
    current_block_size_ = 0;
  }
}

void Segment::write_all_locked(std::string_view buf) {
  size_t done = 0;
  while (done < buf.size()) {
    ssize_t w = ::write(fd_, buf.data() + done, buf.size() - done);
    if (w < 0) {
      if (errno == EINTR) continue;
      throw IoError("write", path_, errno);
    }
    done += static_cast<size_t>(w);
  }
}

void Segment::rollback_locked(uint64_t len) {
  if (::ftruncate(fd_, static_cast<off_t>(len)) != 0) {
    broken_ = true;
    spdlog::error("segment {}: rollback to {} failed, writes disabled", path_, len);
  }
}

ChunkPosition Segment::write(std::string_view record) {
  std::unique_lock lk(mu_);
  if (broken_) {
    throw InvariantViolationError("segment " + path_ + " rejected write after fatal error");
  }

  const uint32_t saved_block = current_block_number_;
  const uint32_t saved_size  = current_block_size_;
  auto restore = [&] {
    current_block_number_ = saved_block;
    current_block_size_   = saved_size;
  };

  // весь кадр (паддинг + чанки) собирается в буфер и уходит одним write
  std::string buf;
  buf.reserve(record.size() + HDR * (record.size() / ChunkConst::MAX_PAYLOAD + 2) + HDR);

  ChunkPosition pos{};
  try {
    // заголовок не помещается в остаток блока: добиваем нулями
    if (current_block_size_ + HDR >= BS) {
      buf.append(BS - current_block_size_, '\0');
      ++current_block_number_;
      current_block_size_ = 0;
    }

    pos = ChunkPosition{id_, current_block_number_, current_block_size_};

    if (current_block_size_ + record.size() + HDR <= BS) {
      append_chunk_locked(buf, record, ChunkType::Full);
    } else {
      size_t left = record.size();
      bool first = true;
      while (left > 0) {
        const size_t cap = BS - current_block_size_ - HDR;
        const size_t n = std::min(cap, left);
        const size_t at = record.size() - left;

        ChunkType t = ChunkType::Middle;
        if (first) t = ChunkType::First;
        else if (n == left) t = ChunkType::Last;

        append_chunk_locked(buf, record.substr(at, n), t);
        left -= n;
        first = false;
      }
    }
  } catch (const WalError&) {
    restore();
    throw;
  }

  const uint64_t start_len = file_size_locked();
  try {
    write_all_locked(buf);
  } catch (const IoError&) {
    // часть кадра могла попасть в файл
    restore();
    rollback_locked(start_len);
    throw;
  }

  spdlog::trace("segment {}: wrote {} bytes at block={} offset={}",
                id_, record.size(), pos.block_number, pos.chunk_offset);
  return pos;
}

std::string Segment::read(uint32_t block_number, uint64_t chunk_offset) const {
  std::shared_lock lk(mu_);

  const uint64_t len = file_size_locked();
  if (chunk_offset >= BS ||
      static_cast<uint64_t>(block_number) * BS + chunk_offset >= len) {
    throw OutOfRangeError("segment " + path_ + ": position block=" + std::to_string(block_number) +
                          " offset=" + std::to_string(chunk_offset) +
                          " is beyond file size " + std::to_string(len));
  }

  auto corrupted = [&](const char* why, uint32_t b, uint64_t off) {
    return CorruptedChunkError("segment " + path_ + ": " + why + " at block=" +
                               std::to_string(b) + " offset=" + std::to_string(off));
  };

  std::string result;
  std::string buf;
  bool first = true;
  for (;;) {
    if (static_cast<uint64_t>(block_number) * BS >= len)
      throw corrupted("record continues past end of file", block_number, chunk_offset);

    read_block_locked(block_number, buf, len);
    if (chunk_offset >= buf.size())
      throw corrupted("record continues past end of file", block_number, chunk_offset);

    const auto c = decode_chunk(std::string_view(buf).substr(chunk_offset));
    if (!c) throw corrupted("truncated chunk", block_number, chunk_offset);
    if (!verify_chunk(*c)) throw corrupted("checksum mismatch", block_number, chunk_offset);
    if (!c->known_type()) throw corrupted("unknown chunk type", block_number, chunk_offset);

    const ChunkType t = c->type();
    const bool expected = first ? (t == ChunkType::Full || t == ChunkType::First)
                                : (t == ChunkType::Middle || t == ChunkType::Last);
    if (!expected) throw corrupted("unexpected chunk type", block_number, chunk_offset);

    result.append(c->payload.data(), c->payload.size());
    if (t == ChunkType::Full || t == ChunkType::Last) break;

    ++block_number;
    chunk_offset = 0;
    first = false;
  }
  return result;
}

void Segment::sync() {
  std::unique_lock lk(mu_);
  if (::fsync(fd_) != 0) throw IoError("fsync", path_, errno);
}

void Segment::remove() {
  std::unique_lock lk(mu_);
  if (::unlink(path_.c_str()) != 0) throw IoError("unlink", path_, errno);
  spdlog::info("segment removed: {}", path_);
}

} // namespace segwal
