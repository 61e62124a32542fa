#pragma once
#include <chunklog/codec.hpp>
#include <chunklog/format.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/uio.h>

namespace chunklog {

enum class OpenMode : uint8_t {
  CREATE, // truncate, write a fresh header
  APPEND  // validate the existing header, continue at EOF
};

struct WriterOptions {
  OpenMode    mode = OpenMode::CREATE;
  Compression compression = Compression::GZIP;

  // flush triggers; any one of them starts a new chunk
  uint64_t                  flush_bytes = 4ull * 1024 * 1024;
  uint64_t                  flush_records = 20000;
  std::chrono::milliseconds flush_interval{5000};

  // fdatasync after each chunk
  bool sync_on_flush = false;
};

// Buffers records and appends them to a .clog file as compressed chunks.
// write_record() may be called from several threads at once; two Writers on
// the same path are not supported.
class Writer {
public:
  Writer(const std::filesystem::path &path, const WriterOptions &opts = {});
  ~Writer();

  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;

  // Throws WriteError when a triggered flush fails, ConfigurationError when
  // level/message cannot be stored.
  void write_record(std::string_view level, std::string_view message);

  // Writes the buffer as one chunk. No-op when nothing is buffered.
  void flush();

  // Final flush, then releases the file. A flush failure is rethrown only
  // after the descriptor is closed. Idempotent.
  void close();

  bool is_open() const;
  const std::filesystem::path &path() const noexcept { return path_; }
  Compression compression() const noexcept { return opts_.compression; }
  uint64_t buffered_bytes() const;
  uint64_t buffered_records() const;
  // Bytes already on disk: header plus written chunks.
  uint64_t file_size() const;

private:
  void open_create();
  void open_append();
  void flush_locked();
  void write_all(const struct ::iovec *iov, int iovcnt);

  std::filesystem::path  path_;
  WriterOptions          opts_;
  std::unique_ptr<Codec> codec_;

  mutable std::mutex mu_;
  int                fd_ = -1;
  uint64_t           file_size_ = 0;

  std::string buffer_;
  uint64_t    buffer_records_ = 0;
  std::chrono::steady_clock::time_point last_flush_;
};

} // namespace chunklog
