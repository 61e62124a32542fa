#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <chunklog/config.hpp>
#include <chunklog/errors.hpp>

#include <cstdlib>

using namespace chunklog;

namespace {
// sets a variable for the lifetime of the guard
struct EnvGuard {
  const char* name;
  EnvGuard(const char* n, const char* v) : name(n) { ::setenv(n, v, 1); }
  ~EnvGuard() { ::unsetenv(name); }
};
} // namespace

TEST_CASE("Switch values") {
  REQUIRE(parse_switch("on") == true);
  REQUIRE(parse_switch("1") == true);
  REQUIRE(parse_switch("true") == true);
  REQUIRE(parse_switch("off") == false);
  REQUIRE(parse_switch("0") == false);
  REQUIRE_FALSE(parse_switch("maybe").has_value());
}

TEST_CASE("Unsigned values") {
  REQUIRE(parse_u64("0") == 0u);
  REQUIRE(parse_u64("4194304") == 4194304u);
  REQUIRE_FALSE(parse_u64("").has_value());
  REQUIRE_FALSE(parse_u64("-1").has_value());
  REQUIRE_FALSE(parse_u64("12k").has_value());
}

TEST_CASE("Environment leaves defaults alone when unset") {
  WriterOptions o;
  apply_env(o);
  WriterOptions def;
  REQUIRE(o.compression == def.compression);
  REQUIRE(o.flush_bytes == def.flush_bytes);
  REQUIRE(o.flush_records == def.flush_records);
  REQUIRE(o.flush_interval == def.flush_interval);
  REQUIRE(o.sync_on_flush == def.sync_on_flush);
}

TEST_CASE("Environment overrides writer options") {
  EnvGuard c("CHUNKLOG_COMPRESSION", "none");
  EnvGuard b("CHUNKLOG_FLUSH_BYTES", "1024");
  EnvGuard r("CHUNKLOG_FLUSH_RECORDS", "10");
  EnvGuard i("CHUNKLOG_FLUSH_INTERVAL_MS", "250");
  EnvGuard s("CHUNKLOG_SYNC", "on");

  WriterOptions o;
  apply_env(o);
  REQUIRE(o.compression == Compression::NONE);
  REQUIRE(o.flush_bytes == 1024);
  REQUIRE(o.flush_records == 10);
  REQUIRE(o.flush_interval == std::chrono::milliseconds(250));
  REQUIRE(o.sync_on_flush);
}

TEST_CASE("Bad environment values are configuration errors") {
  WriterOptions o;
  SECTION("codec") {
    EnvGuard g("CHUNKLOG_COMPRESSION", "lzma");
    REQUIRE_THROWS_AS(apply_env(o), ConfigurationError);
  }
  SECTION("bytes") {
    EnvGuard g("CHUNKLOG_FLUSH_BYTES", "lots");
    REQUIRE_THROWS_AS(apply_env(o), ConfigurationError);
  }
  SECTION("sync") {
    EnvGuard g("CHUNKLOG_SYNC", "sometimes");
    REQUIRE_THROWS_AS(apply_env(o), ConfigurationError);
  }
}
