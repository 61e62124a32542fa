#pragma once
#include <chunklog/writer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace chunklog {

enum class RotateWhen : uint8_t {
  SIZE, // numbered archives: app.clog.1 (newest) .. app.clog.N
  TIME  // timestamped archives: app.clog.2024-01-01_00-00-00
};

struct RotationOptions {
  RotateWhen           when = RotateWhen::SIZE;
  uint64_t             max_bytes = 64ull * 1024 * 1024;
  std::chrono::seconds interval{24 * 3600};
  size_t               backup_count = 5;
  // Used for the first open; every reopen after a rotation is CREATE.
  WriterOptions writer{.mode = OpenMode::APPEND};
};

// Writer front end that swaps the underlying file by size or by time. One
// mutex covers both writes and swaps, so no record lands in two files or in
// neither.
class RotatingWriter {
public:
  RotatingWriter(const std::filesystem::path &path, const RotationOptions &opts);
  ~RotatingWriter();

  RotatingWriter(const RotatingWriter &) = delete;
  RotatingWriter &operator=(const RotatingWriter &) = delete;

  void write_record(std::string_view level, std::string_view message);
  void flush();
  // Forces a swap now.
  void rotate();
  void close();

  const std::filesystem::path &path() const noexcept { return path_; }
  // Archives of this file, oldest first.
  std::vector<std::filesystem::path> archives() const;

private:
  bool should_rotate_locked(std::chrono::system_clock::time_point now) const;
  void rotate_locked(std::chrono::system_clock::time_point now);
  void shift_numbered_locked();
  void archive_timestamped_locked();

  std::filesystem::path   path_;
  RotationOptions         opts_;
  mutable std::mutex      mu_;
  std::unique_ptr<Writer> writer_;

  std::chrono::system_clock::time_point period_start_;
  std::chrono::system_clock::time_point next_rollover_;
};

} // namespace chunklog
