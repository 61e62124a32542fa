#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>

#include <zlib.h>

#include <string>

using namespace chunklog;

static std::string sample_payload() {
  std::string s;
  for (int i = 0; i < 500; ++i)
    s += "2024-01-01T00:00:00.000000\tINFO\tmessage number " + std::to_string(i) + "\n";
  return s;
}

TEST_CASE("Identity codec passes bytes through") {
  auto c = make_codec(Compression::NONE);
  REQUIRE(c->code() == Compression::NONE);
  const std::string raw = sample_payload();
  REQUIRE(c->compress(raw) == raw);
  REQUIRE(c->decompress(raw, raw.size()) == raw);
  REQUIRE_THROWS_AS(c->decompress(raw, raw.size() + 1), ReadError);
}

TEST_CASE("Gzip codec output is a gzip stream") {
  auto c = make_codec(Compression::GZIP);
  REQUIRE(std::string(c->name()) == "gzip");

  const std::string raw = sample_payload();
  const std::string z = c->compress(raw);
  REQUIRE(z.size() < raw.size());
  REQUIRE(static_cast<unsigned char>(z[0]) == 0x1f);
  REQUIRE(static_cast<unsigned char>(z[1]) == 0x8b);
  REQUIRE(c->decompress(z, raw.size()) == raw);
}

TEST_CASE("Gzip codec accepts streams from other encoders") {
  // zlib's own gzip framing at a different level
  const std::string raw = sample_payload();
  z_stream zs{};
  REQUIRE(deflateInit2(&zs, 1, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) == Z_OK);
  std::string out(deflateBound(&zs, raw.size()), '\0');
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(raw.data()));
  zs.avail_in = static_cast<uInt>(raw.size());
  zs.next_out = reinterpret_cast<Bytef *>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  REQUIRE(deflate(&zs, Z_FINISH) == Z_STREAM_END);
  out.resize(zs.total_out);
  deflateEnd(&zs);

  auto c = make_codec(Compression::GZIP);
  REQUIRE(c->decompress(out, raw.size()) == raw);
}

TEST_CASE("Gzip codec rejects corrupt or mis-sized input") {
  auto c = make_codec(Compression::GZIP);
  const std::string raw = sample_payload();
  std::string z = c->compress(raw);

  SECTION("wrong declared size") {
    REQUIRE_THROWS_AS(c->decompress(z, raw.size() - 1), ReadError);
    REQUIRE_THROWS_AS(c->decompress(z, raw.size() + 1), ReadError);
  }
  SECTION("truncated") {
    REQUIRE_THROWS_AS(c->decompress(z.substr(0, z.size() / 2), raw.size()),
                      ReadError);
  }
  SECTION("garbage") {
    REQUIRE_THROWS_AS(c->decompress("definitely not gzip", 10), ReadError);
  }
}

TEST_CASE("Gzip codec does not trust an inflated declared size") {
  auto c = make_codec(Compression::GZIP);
  const std::string raw = sample_payload();
  const std::string z = c->compress(raw);
  // a header claiming almost 4 GiB must fail on the real output, not allocate
  REQUIRE_THROWS_AS(c->decompress(z, 0xFFFFFFF0u), ReadError);
  REQUIRE_THROWS_AS(c->decompress(z, raw.size() * 64), ReadError);
  REQUIRE(c->decompress(z, raw.size()) == raw);
}

TEST_CASE("Empty chunk compresses") {
  auto c = make_codec(Compression::GZIP);
  auto z = c->compress("");
  REQUIRE(c->decompress(z, 0).empty());
}

TEST_CASE("Zstd codec availability is reported") {
  if (!codec_available(Compression::ZSTD)) {
    REQUIRE_THROWS_AS(make_codec(Compression::ZSTD), UnsupportedCompressionError);
    return;
  }
  auto c = make_codec(Compression::ZSTD);
  const std::string raw = sample_payload();
  const std::string z = c->compress(raw);
  REQUIRE(c->decompress(z, raw.size()) == raw);
  REQUIRE_THROWS_AS(c->decompress(z, raw.size() + 5), ReadError);
  REQUIRE_THROWS_AS(c->decompress(z, 0xFFFFFFF0u), ReadError);
  REQUIRE_THROWS_AS(c->decompress(z.substr(0, z.size() - 3), raw.size()), ReadError);
  REQUIRE_THROWS_AS(c->decompress("nope", 4), ReadError);
}

TEST_CASE("Unknown codec code") {
  REQUIRE_THROWS_AS(make_codec(static_cast<Compression>(7)),
                    UnsupportedCompressionError);
}
