#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <chunklog/async_writer.hpp>
#include <chunklog/errors.hpp>
#include <chunklog/reader.hpp>

#include <unistd.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace chunklog;
namespace fs = std::filesystem;

static fs::path mkd(const char* name) {
  auto d = fs::temp_directory_path() /
           ("chunklog_async_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("Async writer drains every record on stop") {
  auto d = mkd("drain");
  auto p = d / "a.clog";
  auto w = std::make_shared<Writer>(p, WriterOptions{.compression = Compression::GZIP});
  {
    AsyncWriter aw(w, AsyncOptions{.queue_capacity = 16});
    for (int i = 0; i < 1000; ++i)
      REQUIRE(aw.submit("INFO", std::to_string(i)));
    aw.stop();
    REQUIRE(aw.pending() == 0);
    REQUIRE(aw.failed_writes() == 0);
    REQUIRE_FALSE(w->is_open());
  }

  Reader r(p);
  auto all = r.read_all();
  REQUIRE(all.size() == 1000);
  for (int i = 0; i < 1000; ++i) REQUIRE(all[i].message == std::to_string(i));
}

TEST_CASE("Submit after stop is refused") {
  auto d = mkd("refuse");
  auto w = std::make_shared<Writer>(d / "a.clog");
  AsyncWriter aw(w);
  aw.stop();
  REQUIRE_FALSE(aw.submit("INFO", "late"));
  REQUIRE_NOTHROW(aw.stop());
}

TEST_CASE("Many producers feed one consumer") {
  auto d = mkd("producers");
  auto p = d / "a.clog";
  auto w = std::make_shared<Writer>(p, WriterOptions{.compression = Compression::NONE,
                                                     .flush_records = 100});
  {
    AsyncWriter aw(w, AsyncOptions{.queue_capacity = 8});
    std::vector<std::thread> ts;
    for (int t = 0; t < 4; ++t)
      ts.emplace_back([&aw, t] {
        for (int i = 0; i < 250; ++i)
          aw.submit("T" + std::to_string(t), std::to_string(i));
      });
    for (auto& th : ts) th.join();
  } // destructor stops and drains

  Reader r(p);
  REQUIRE(r.read_all().size() == 1000);
}

TEST_CASE("Failed writes are counted, not thrown") {
  auto d = mkd("failed");
  auto w = std::make_shared<Writer>(d / "a.clog");
  AsyncWriter aw(w);
  REQUIRE(aw.submit("BAD\tLEVEL", "x"));
  REQUIRE(aw.submit("INFO", "ok"));
  aw.stop();
  REQUIRE(aw.failed_writes() == 1);
}

TEST_CASE("Async writer rejects bad construction") {
  auto d = mkd("ctor");
  REQUIRE_THROWS_AS(AsyncWriter(nullptr), ConfigurationError);
  auto w = std::make_shared<Writer>(d / "a.clog");
  REQUIRE_THROWS_AS(AsyncWriter(w, AsyncOptions{.queue_capacity = 0}),
                    ConfigurationError);
}
