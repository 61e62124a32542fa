#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <chunklog/reader.hpp>
#include <chunklog/writer.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

using namespace chunklog;
namespace fs = std::filesystem;

static fs::path mkd(const char* name) {
  auto d = fs::temp_directory_path() /
           ("chunklog_tail_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

// Writes records "0".."total-1", cutting a chunk after each size in sizes
// (cycled) so chunk boundaries fall at irregular places.
static void write_split(const fs::path& p, Compression c, int total,
                        const std::vector<int>& sizes) {
  WriterOptions o;
  o.compression = c;
  o.flush_bytes = 1ull << 30;
  o.flush_records = 1u << 30;
  o.flush_interval = std::chrono::hours(1);
  Writer w(p, o);
  size_t k = 0;
  int in_chunk = 0;
  for (int i = 0; i < total; ++i) {
    w.write_record(i % 2 ? "INFO" : "DEBUG", std::to_string(i));
    if (++in_chunk == sizes[k % sizes.size()]) {
      w.flush();
      in_chunk = 0;
      ++k;
    }
  }
}

static std::vector<std::string> messages(const std::vector<Record>& rs) {
  std::vector<std::string> out;
  for (auto& r : rs) out.push_back(r.message);
  return out;
}

static std::vector<std::string> expected_last(int total, int n) {
  std::vector<std::string> out;
  for (int i = std::max(0, total - n); i < total; ++i) out.push_back(std::to_string(i));
  return out;
}

TEST_CASE("Tail of [2,2,1] chunks returns the last record only") {
  auto d = mkd("221");
  auto p = d / "a.clog";
  write_split(p, Compression::NONE, 5, {2, 2, 1});

  Reader r(p);
  auto chunks = r.read_chunks();
  std::vector<uint32_t> counts;
  while (auto c = chunks.next()) counts.push_back(c->record_count);
  REQUIRE(counts == std::vector<uint32_t>{2, 2, 1});

  Reader t(p);
  auto last = t.tail(1);
  REQUIRE(last.size() == 1);
  REQUIRE(last[0].message == "4");
}

TEST_CASE("Tail with a huge n returns every record") {
  auto d = mkd("huge_n");
  auto p = d / "a.clog";
  write_split(p, Compression::NONE, 5, {2, 2, 1});

  Reader r(p);
  REQUIRE(messages(r.tail(1000)) == expected_last(5, 5));
  REQUIRE(messages(r.tail(std::numeric_limits<size_t>::max())) == expected_last(5, 5));
  REQUIRE(messages(r.tail(std::numeric_limits<size_t>::max() / 2 + 1)) ==
          expected_last(5, 5));
}

TEST_CASE("Tail returns exactly the last n for every n") {
  auto d = mkd("every_n");
  for (auto c : {Compression::NONE, Compression::GZIP, Compression::ZSTD}) {
    if (!codec_available(c)) continue;
    auto p = d / (std::string(compression_name(c)) + ".clog");
    constexpr int TOTAL = 37;
    write_split(p, c, TOTAL, {1, 5, 3, 8, 2});

    Reader r(p);
    for (int n = 0; n <= TOTAL + 3; ++n) {
      INFO("codec " << compression_name(c) << " n=" << n);
      REQUIRE(messages(r.tail(static_cast<size_t>(n))) == expected_last(TOTAL, n));
    }
  }
}

TEST_CASE("Tail matches the end of a full read") {
  auto d = mkd("vs_full");
  auto p = d / "a.clog";
  write_split(p, Compression::GZIP, 100, {7, 13});
  Reader r(p);
  auto all = r.read_all();
  auto last = r.tail(20);
  REQUIRE(last.size() == 20);
  REQUIRE(std::vector<Record>(all.end() - 20, all.end()) == last);
}

TEST_CASE("Tail then follow neither skips nor repeats") {
  auto d = mkd("chain");
  auto p = d / "a.clog";
  write_split(p, Compression::NONE, 6, {3});

  Reader r(p);
  auto last = r.tail(2);
  REQUIRE(messages(last) == std::vector<std::string>{"4", "5"});

  {
    WriterOptions o;
    o.mode = OpenMode::APPEND;
    o.compression = Compression::NONE;
    Writer w(p, o);
    w.write_record("INFO", "6");
  }

  // the appended chunk is already there, so a follow stream returns at once
  auto more = r.read_records(ReadOptions{.follow = true});
  auto next = more.next();
  REQUIRE(next);
  REQUIRE(next->message == "6");
}
