#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <chunklog/errors.hpp>
#include <chunklog/reader.hpp>
#include <chunklog/rotation.hpp>

#include <unistd.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace chunklog;
namespace fs = std::filesystem;

static fs::path mkd(const char* name) {
  auto d = fs::temp_directory_path() /
           ("chunklog_rot_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static size_t count_records(const fs::path& p) {
  Reader r(p);
  return r.read_all().size();
}

static RotationOptions by_size(uint64_t max_bytes, size_t keep) {
  RotationOptions o;
  o.when = RotateWhen::SIZE;
  o.max_bytes = max_bytes;
  o.backup_count = keep;
  o.writer.compression = Compression::NONE;
  return o;
}

TEST_CASE("Size rotation rolls numbered archives") {
  auto d = mkd("size");
  auto base = d / "app.clog";
  {
    RotatingWriter rw(base, by_size(512, 3));
    const std::string body(100, 'x');
    for (int i = 0; i < 40; ++i) rw.write_record("INFO", body);
    auto arch = rw.archives();
    REQUIRE(arch.size() == 3);
    REQUIRE(arch.back() == d / "app.clog.1");
    REQUIRE(arch.front() == d / "app.clog.3");
  }
  REQUIRE(fs::exists(base));
  REQUIRE(fs::exists(d / "app.clog.1"));
  REQUIRE(fs::exists(d / "app.clog.3"));
  REQUIRE_FALSE(fs::exists(d / "app.clog.4"));

  // every kept file is a complete container on its own
  for (auto p : {base, d / "app.clog.1", d / "app.clog.2", d / "app.clog.3"})
    REQUIRE(count_records(p) > 0);
}

TEST_CASE("Records are neither lost nor duplicated across swaps") {
  auto d = mkd("no_loss");
  auto base = d / "app.clog";
  constexpr int THREADS = 4;
  constexpr int PER_THREAD = 200;
  {
    auto o = by_size(2048, 1000);
    o.writer.flush_records = 5;
    RotatingWriter rw(base, o);
    std::vector<std::thread> ts;
    for (int t = 0; t < THREADS; ++t)
      ts.emplace_back([&rw] {
        for (int i = 0; i < PER_THREAD; ++i) rw.write_record("INFO", std::to_string(i));
      });
    for (auto& th : ts) th.join();
  }

  size_t total = count_records(base);
  for (int i = 1; fs::exists(d / ("app.clog." + std::to_string(i))); ++i)
    total += count_records(d / ("app.clog." + std::to_string(i)));
  REQUIRE(total == THREADS * PER_THREAD);
}

TEST_CASE("Zero backups drops the rotated file") {
  auto d = mkd("zero");
  auto base = d / "app.clog";
  RotatingWriter rw(base, by_size(4096, 0));
  rw.write_record("INFO", "old");
  rw.rotate();
  rw.write_record("INFO", "new");
  rw.close();
  REQUIRE(rw.archives().empty());
  Reader r(base);
  auto all = r.read_all();
  REQUIRE(all.size() == 1);
  REQUIRE(all[0].message == "new");
}

TEST_CASE("Time rotation stamps archives and keeps the newest") {
  auto d = mkd("time");
  auto base = d / "app.clog";
  RotationOptions o;
  o.when = RotateWhen::TIME;
  o.interval = std::chrono::seconds(1);
  o.backup_count = 2;
  o.writer.compression = Compression::GZIP;

  RotatingWriter rw(base, o);
  for (int round = 0; round < 4; ++round) {
    rw.write_record("INFO", "round " + std::to_string(round));
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  }
  rw.write_record("INFO", "last");
  rw.close();

  auto arch = rw.archives();
  REQUIRE(arch.size() == 2);
  REQUIRE(arch[0] < arch[1]);
  const std::string name = arch[0].filename().string();
  REQUIRE(name.rfind("app.clog.", 0) == 0);
  REQUIRE(name.size() == std::string("app.clog.").size() + 19);

  REQUIRE(count_records(arch[1]) == 1);
  Reader r(base);
  REQUIRE(r.read_all().back().message == "last");
}

TEST_CASE("Forced rotation with timestamps does not clobber archives") {
  auto d = mkd("collide");
  auto base = d / "app.clog";
  RotationOptions o;
  o.when = RotateWhen::TIME;
  o.interval = std::chrono::hours(1);
  o.backup_count = 10;
  RotatingWriter rw(base, o);
  for (int i = 0; i < 3; ++i) {
    rw.write_record("INFO", std::to_string(i));
    rw.rotate();
  }
  REQUIRE(rw.archives().size() == 3);
}

TEST_CASE("Appending resumes the existing file") {
  auto d = mkd("resume");
  auto base = d / "app.clog";
  {
    RotatingWriter rw(base, by_size(1 << 20, 2));
    rw.write_record("INFO", "before");
  }
  {
    RotatingWriter rw(base, by_size(1 << 20, 2));
    rw.write_record("INFO", "after");
  }
  REQUIRE(count_records(base) == 2);
}

TEST_CASE("Rotation options are validated") {
  auto d = mkd("validate");
  RotationOptions o;
  o.when = RotateWhen::TIME;
  o.interval = std::chrono::seconds(0);
  REQUIRE_THROWS_AS(RotatingWriter(d / "a.clog", o), ConfigurationError);
  REQUIRE_THROWS_AS(RotatingWriter(d / "b.clog", by_size(8, 1)), ConfigurationError);
}

TEST_CASE("Closed rotating writer refuses writes") {
  auto d = mkd("closed");
  RotatingWriter rw(d / "a.clog", by_size(4096, 1));
  rw.close();
  REQUIRE_NOTHROW(rw.close());
  REQUIRE_THROWS_AS(rw.write_record("INFO", "x"), WriteError);
}
