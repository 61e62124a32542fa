// source/writer.cpp
#include <chunklog/errors.hpp>
#include <chunklog/log.hpp>
#include <chunklog/writer.hpp>

#include <fmt/format.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <limits>
#include <optional>

namespace fs = std::filesystem;

namespace chunklog {

static std::string errno_text() { return std::strerror(errno); }

Writer::Writer(const fs::path &path, const WriterOptions &opts)
    : path_(path), opts_(opts) {
  if (path_.empty())
    throw ConfigurationError("writer: empty path");

  codec_ = make_codec(opts_.compression);

  try {
    std::error_code ec;
    if (opts_.mode == OpenMode::APPEND && fs::exists(path_, ec))
      open_append();
    else
      open_create();
  } catch (const Error &) {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    throw;
  }

  last_flush_ = std::chrono::steady_clock::now();
  logger()->debug("writer open: {} (compression={}, size={})", path_.string(),
                  codec_->name(), file_size_);
}

Writer::~Writer() {
  try {
    close();
  } catch (const Error &e) {
    logger()->error("writer close failed for {}: {}", path_.string(), e.what());
  }
}

void Writer::open_create() {
  fd_ = ::open(path_.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_APPEND, 0644);
  if (fd_ < 0)
    throw WriteError(
        fmt::format("cannot create {}: {}", path_.string(), errno_text()));

  const auto hdr = encode_file_header(opts_.compression);
  struct ::iovec iov[1];
  iov[0].iov_base = const_cast<char *>(hdr.data());
  iov[0].iov_len = hdr.size();
  write_all(iov, 1);
  file_size_ = hdr.size();
}

void Writer::open_append() {
  fd_ = ::open(path_.c_str(), O_RDWR | O_APPEND);
  if (fd_ < 0)
    throw WriteError(
        fmt::format("cannot open {} for append: {}", path_.string(), errno_text()));

  char buf[FormatConst::HEADER_SIZE];
  size_t got = 0;
  while (got < sizeof(buf)) {
    ssize_t r = ::pread(fd_, buf + got, sizeof(buf) - got,
                        static_cast<off_t>(got));
    if (r < 0) {
      if (errno == EINTR) continue;
      throw WriteError(fmt::format("cannot read header of {}: {}",
                                   path_.string(), errno_text()));
    }
    if (r == 0) break;
    got += static_cast<size_t>(r);
  }

  const FileHeader hdr = decode_file_header(std::string_view(buf, got));
  if (hdr.compression != opts_.compression)
    throw ConfigurationError(fmt::format(
        "{} is {}-compressed, refusing to append {} chunks", path_.string(),
        compression_name(hdr.compression), compression_name(opts_.compression)));

  const off_t end = ::lseek(fd_, 0, SEEK_END);
  if (end < 0)
    throw WriteError(
        fmt::format("cannot seek {}: {}", path_.string(), errno_text()));
  file_size_ = static_cast<uint64_t>(end);
}

void Writer::write_record(std::string_view level, std::string_view message) {
  if (level.find(FormatConst::FIELD_DELIM) != std::string_view::npos ||
      level.find(FormatConst::RECORD_DELIM) != std::string_view::npos)
    throw ConfigurationError("level must not contain tab or newline");
  if (!is_valid_utf8(level) || !is_valid_utf8(message))
    throw ConfigurationError("level and message must be UTF-8");

  std::lock_guard<std::mutex> lk(mu_);
  if (fd_ < 0)
    throw WriteError(fmt::format("writer for {} is closed", path_.string()));

  serialize_record(buffer_, now_timestamp(), level, message);
  ++buffer_records_;

  const auto now = std::chrono::steady_clock::now();
  const bool by_size = buffer_.size() >= opts_.flush_bytes;
  const bool by_count = buffer_records_ >= opts_.flush_records;
  const bool by_time = !buffer_.empty() && now - last_flush_ >= opts_.flush_interval;

  if (by_size || by_count || by_time)
    flush_locked();
}

void Writer::flush() {
  std::lock_guard<std::mutex> lk(mu_);
  if (fd_ < 0) return;
  flush_locked();
}

void Writer::flush_locked() {
  if (buffer_.empty()) return;

  if (buffer_.size() > std::numeric_limits<uint32_t>::max())
    throw WriteError(fmt::format("chunk of {} bytes exceeds the format limit",
                                 buffer_.size()));

  const std::string payload = codec_->compress(buffer_);
  if (payload.size() > std::numeric_limits<uint32_t>::max())
    throw WriteError("compressed chunk exceeds the format limit");

  ChunkHeader ch{};
  ch.compressed_size = static_cast<uint32_t>(payload.size());
  ch.uncompressed_size = static_cast<uint32_t>(buffer_.size());
  ch.record_count = static_cast<uint32_t>(buffer_records_);
  const auto hdr = encode_chunk_header(ch);

  struct ::iovec iov[2];
  iov[0].iov_base = const_cast<char *>(hdr.data());
  iov[0].iov_len = hdr.size();
  iov[1].iov_base = const_cast<char *>(payload.data());
  iov[1].iov_len = payload.size();
  write_all(iov, 2);
  file_size_ += hdr.size() + payload.size();

  if (opts_.sync_on_flush && ::fdatasync(fd_) != 0)
    throw WriteError(
        fmt::format("fdatasync {} failed: {}", path_.string(), errno_text()));

  logger()->debug("chunk flushed: {} records, {} -> {} bytes", ch.record_count,
                  ch.uncompressed_size, ch.compressed_size);

  buffer_.clear();
  buffer_records_ = 0;
  last_flush_ = std::chrono::steady_clock::now();
}

void Writer::write_all(const struct ::iovec *iov, int iovcnt) {
  struct ::iovec local[2];
  if (iovcnt > 2) iovcnt = 2;
  for (int i = 0; i < iovcnt; ++i) local[i] = iov[i];

  struct ::iovec *cur = local;
  int left = iovcnt;
  while (left > 0) {
    ssize_t w = ::writev(fd_, cur, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      throw WriteError(
          fmt::format("write to {} failed: {}", path_.string(), errno_text()));
    }
    // advance past what the kernel took
    auto n = static_cast<size_t>(w);
    while (left > 0 && n >= cur->iov_len) {
      n -= cur->iov_len;
      ++cur;
      --left;
    }
    if (left > 0) {
      cur->iov_base = static_cast<char *>(cur->iov_base) + n;
      cur->iov_len -= n;
    }
  }
}

void Writer::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (fd_ < 0) return;

  std::optional<WriteError> flush_err;
  try {
    flush_locked();
  } catch (const WriteError &e) {
    logger()->warn("final flush of {} failed: {}", path_.string(), e.what());
    flush_err = e;
  }

  const int rc = ::close(fd_);
  fd_ = -1;
  logger()->debug("writer closed: {}", path_.string());

  if (flush_err) throw *flush_err;
  if (rc != 0)
    throw WriteError(
        fmt::format("close {} failed: {}", path_.string(), errno_text()));
}

bool Writer::is_open() const {
  std::lock_guard<std::mutex> lk(mu_);
  return fd_ >= 0;
}

uint64_t Writer::buffered_bytes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return buffer_.size();
}

uint64_t Writer::buffered_records() const {
  std::lock_guard<std::mutex> lk(mu_);
  return buffer_records_;
}

uint64_t Writer::file_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return file_size_;
}

} // namespace chunklog
