// source/reader.cpp
#include <chunklog/errors.hpp>
#include <chunklog/log.hpp>
#include <chunklog/reader.hpp>

#include <fmt/format.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace fs = std::filesystem;

namespace chunklog {

static std::string errno_text() { return std::strerror(errno); }

Reader::Reader(const fs::path &path) : path_(path) {
  fd_ = ::open(path_.c_str(), O_RDONLY);
  if (fd_ < 0)
    throw ReadError(
        fmt::format("cannot open {}: {}", path_.string(), errno_text()));

  try {
    char buf[FormatConst::HEADER_SIZE];
    const size_t got = read_full(buf, sizeof(buf));
    header_ = decode_file_header(std::string_view(buf, got));
    codec_ = make_codec(header_.compression);
  } catch (const Error &) {
    ::close(fd_);
    fd_ = -1;
    throw;
  }
  logger()->debug("reader open: {} (compression={})", path_.string(),
                  compression_name(header_.compression));
}

Reader::~Reader() {
  try {
    close();
  } catch (const Error &e) {
    logger()->warn("reader close failed for {}: {}", path_.string(), e.what());
  }
}

void Reader::close() {
  if (fd_ < 0) return;
  const int rc = ::close(fd_);
  fd_ = -1;
  if (rc != 0)
    throw ReadError(
        fmt::format("close {} failed: {}", path_.string(), errno_text()));
}

void Reader::ensure_open() const {
  if (fd_ < 0)
    throw ReadError(fmt::format("reader for {} is closed", path_.string()));
}

size_t Reader::read_full(char *dst, size_t n) {
  size_t total = 0;
  while (total < n) {
    ssize_t r = ::read(fd_, dst + total, n - total);
    if (r < 0) {
      if (errno == EINTR) continue;
      throw ReadError(
          fmt::format("read {} failed: {}", path_.string(), errno_text()));
    }
    if (r == 0) break; // EOF
    total += static_cast<size_t>(r);
  }
  return total;
}

void Reader::seek_to(uint64_t off) {
  if (::lseek(fd_, static_cast<off_t>(off), SEEK_SET) < 0)
    throw ReadError(
        fmt::format("seek {} failed: {}", path_.string(), errno_text()));
}

std::optional<Chunk> Reader::next_chunk(const ReadOptions &opts) {
  ensure_open();

  char hb[FormatConst::CHUNK_HEADER_SIZE];
  for (;;) {
    const size_t got = read_full(hb, sizeof(hb));
    if (got == 0) {
      if (!opts.follow) return std::nullopt;
      std::this_thread::sleep_for(opts.poll_interval);
      continue;
    }
    if (got < sizeof(hb))
      throw MalformedFileError(fmt::format(
          "{}: truncated chunk header ({} of {} bytes)", path_.string(), got,
          sizeof(hb)));
    break;
  }
  const ChunkHeader ch = decode_chunk_header(std::string_view(hb, sizeof(hb)));

  // refuse to allocate for a payload the file cannot hold
  const off_t pos = ::lseek(fd_, 0, SEEK_CUR);
  struct stat st {};
  if (pos < 0 || ::fstat(fd_, &st) != 0)
    throw ReadError(
        fmt::format("stat {} failed: {}", path_.string(), errno_text()));
  if (static_cast<uint64_t>(st.st_size) - static_cast<uint64_t>(pos) <
      ch.compressed_size)
    throw MalformedFileError(
        fmt::format("{}: truncated chunk payload", path_.string()));

  std::string comp(ch.compressed_size, '\0');
  if (read_full(comp.data(), comp.size()) < comp.size())
    throw MalformedFileError(
        fmt::format("{}: truncated chunk payload", path_.string()));

  Chunk c;
  c.payload = codec_->decompress(comp, ch.uncompressed_size);
  c.record_count = ch.record_count;
  return c;
}

std::optional<Chunk> ChunkStream::next() { return reader_->next_chunk(opts_); }

std::optional<Record> RecordStream::next() {
  while (pending_.empty()) {
    auto chunk = chunks_.next();
    if (!chunk) return std::nullopt;
    for (auto &r : split_payload(chunk->payload))
      pending_.push_back(std::move(r));
  }
  Record r = std::move(pending_.front());
  pending_.pop_front();
  return r;
}

ChunkStream Reader::read_chunks(const ReadOptions &opts) {
  ensure_open();
  return ChunkStream(this, opts);
}

RecordStream Reader::read_records(const ReadOptions &opts) {
  return RecordStream(read_chunks(opts));
}

std::vector<Record> Reader::read_all() {
  std::vector<Record> out;
  auto stream = read_records();
  while (auto r = stream.next())
    out.push_back(std::move(*r));
  return out;
}

std::vector<Reader::ChunkMeta> Reader::scan_chunk_index(uint64_t &end_offset) {
  struct stat st {};
  if (::fstat(fd_, &st) != 0)
    throw ReadError(
        fmt::format("stat {} failed: {}", path_.string(), errno_text()));
  const auto file_size = static_cast<uint64_t>(st.st_size);

  std::vector<ChunkMeta> index;
  uint64_t off = FormatConst::HEADER_SIZE;
  seek_to(off);

  char hb[FormatConst::CHUNK_HEADER_SIZE];
  for (;;) {
    const size_t got = read_full(hb, sizeof(hb));
    if (got == 0) break;
    if (got < sizeof(hb))
      throw MalformedFileError(fmt::format(
          "{}: truncated chunk header at offset {}", path_.string(), off));

    const ChunkHeader ch = decode_chunk_header(std::string_view(hb, sizeof(hb)));
    const uint64_t data_off = off + sizeof(hb);
    if (data_off + ch.compressed_size > file_size)
      throw MalformedFileError(fmt::format(
          "{}: truncated chunk payload at offset {}", path_.string(), data_off));

    index.push_back(ChunkMeta{data_off, ch.compressed_size,
                              ch.uncompressed_size, ch.record_count});
    off = data_off + ch.compressed_size;
    seek_to(off); // skip the payload, no decompression
  }
  end_offset = off;
  return index;
}

std::vector<Record> Reader::tail(size_t n) {
  ensure_open();

  uint64_t end_off = 0;
  const auto index = scan_chunk_index(end_off);

  // newest to oldest until the selected chunks cover n records
  size_t first = index.size();
  uint64_t remaining = n;
  while (remaining > 0 && first > 0) {
    --first;
    const uint32_t count = index[first].record_count;
    if (count >= remaining) break;
    remaining -= count;
  }
  logger()->debug("tail({}): {} chunks scanned, decompressing {}", n,
                  index.size(), index.size() - first);

  std::vector<Record> out;
  for (size_t i = first; i < index.size(); ++i) {
    const auto &m = index[i];
    seek_to(m.data_offset);
    std::string comp(m.compressed_size, '\0');
    if (read_full(comp.data(), comp.size()) < comp.size())
      throw MalformedFileError(
          fmt::format("{}: truncated chunk payload", path_.string()));
    const std::string raw = codec_->decompress(comp, m.uncompressed_size);
    for (auto &r : split_payload(raw))
      out.push_back(std::move(r));
  }

  // continue from here with a follow stream
  seek_to(end_off);

  if (out.size() > n)
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(n));
  return out;
}

} // namespace chunklog
