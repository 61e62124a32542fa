#pragma once
#include <chunklog/codec.hpp>
#include <chunklog/format.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunklog {

struct ReadOptions {
  // keep polling at end of file instead of finishing
  bool                      follow = false;
  std::chrono::milliseconds poll_interval{100};
};

struct Chunk {
  std::string payload; // decompressed
  uint32_t    record_count = 0;
};

class Reader;

// Forward-only stream of decompressed chunks. In follow mode next() blocks
// until another chunk is appended; stop calling it to stop following.
class ChunkStream {
public:
  std::optional<Chunk> next();

private:
  friend class Reader;
  ChunkStream(Reader *r, ReadOptions o) : reader_(r), opts_(o) {}

  Reader     *reader_;
  ReadOptions opts_;
};

class RecordStream {
public:
  std::optional<Record> next();

private:
  friend class Reader;
  explicit RecordStream(ChunkStream chunks) : chunks_(chunks) {}

  ChunkStream        chunks_;
  std::deque<Record> pending_;
};

// Reads a .clog file. Not thread-safe; streams borrow the Reader and must
// not outlive it.
class Reader {
public:
  // Throws ReadError, MalformedFileError or UnsupportedCompressionError.
  explicit Reader(const std::filesystem::path &path);
  ~Reader();

  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;

  ChunkStream read_chunks(const ReadOptions &opts = {});
  RecordStream read_records(const ReadOptions &opts = {});
  std::vector<Record> read_all();

  // Last n records, oldest first, decompressing only the trailing chunks.
  // Leaves the position at the end of the scanned chunks.
  std::vector<Record> tail(size_t n);

  void close();

  bool is_open() const noexcept { return fd_ >= 0; }
  const std::filesystem::path &path() const noexcept { return path_; }
  Compression compression() const noexcept { return header_.compression; }
  uint16_t format_version() const noexcept { return header_.version; }

private:
  friend class ChunkStream;

  struct ChunkMeta {
    uint64_t data_offset;
    uint32_t compressed_size;
    uint32_t uncompressed_size;
    uint32_t record_count;
  };

  std::optional<Chunk> next_chunk(const ReadOptions &opts);
  std::vector<ChunkMeta> scan_chunk_index(uint64_t &end_offset);
  size_t read_full(char *dst, size_t n);
  void seek_to(uint64_t off);
  void ensure_open() const;

  std::filesystem::path  path_;
  int                    fd_ = -1;
  FileHeader             header_{};
  std::unique_ptr<Codec> codec_;
};

} // namespace chunklog
