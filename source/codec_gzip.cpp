// source/codec_gzip.cpp
#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>

#include <fmt/format.h>
#include <zlib.h>

#include <algorithm>
#include <limits>

namespace chunklog {

// windowBits 15 + 16 selects the gzip wrapper (RFC 1952)
static constexpr int GZIP_WINDOW_BITS = 15 + 16;
static constexpr int GZIP_LEVEL = 9;
// initial and minimum growth of the inflate buffer
static constexpr size_t INFLATE_STEP = 64 * 1024;

struct GzipCodec : Codec {
  const char *name() const override { return "gzip"; }
  Compression code() const override { return Compression::GZIP; }

  std::string compress(std::string_view raw) const override {
    if (raw.size() > std::numeric_limits<uInt>::max())
      throw WriteError("gzip: chunk too large");

    z_stream zs{};
    int rc = deflateInit2(&zs, GZIP_LEVEL, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK)
      throw WriteError(fmt::format("gzip: deflateInit2 failed ({})", rc));

    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(raw.size())));
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(raw.data()));
    zs.avail_in = static_cast<uInt>(raw.size());
    zs.next_out = reinterpret_cast<Bytef *>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    rc = deflate(&zs, Z_FINISH);
    const auto produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
      throw WriteError(fmt::format("gzip: deflate failed ({})", rc));
    out.resize(produced);
    return out;
  }

  // Size-agnostic inflate; concatenated members are accepted. The buffer
  // grows with the output actually produced, so a lying chunk header cannot
  // force a large allocation. Output beyond expected_size is corruption.
  std::string decompress(std::string_view comp,
                         size_t expected_size) const override {
    if (comp.size() > std::numeric_limits<uInt>::max())
      throw ReadError("gzip: chunk too large");

    std::string out;
    out.resize(std::min(expected_size, INFLATE_STEP));

    z_stream zs{};
    int rc = inflateInit2(&zs, GZIP_WINDOW_BITS);
    if (rc != Z_OK)
      throw ReadError(fmt::format("gzip: inflateInit2 failed ({})", rc));

    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(comp.data()));
    zs.avail_in = static_cast<uInt>(comp.size());
    size_t produced = 0;
    char overflow = 0;

    for (;;) {
      if (produced == out.size() && out.size() < expected_size) {
        const size_t grow = std::max(out.size(), INFLATE_STEP);
        out.resize(std::min(expected_size, out.size() + grow));
      }
      if (produced < out.size()) {
        zs.next_out = reinterpret_cast<Bytef *>(out.data() + produced);
        zs.avail_out = static_cast<uInt>(
            std::min<size_t>(out.size() - produced, std::numeric_limits<uInt>::max()));
      } else {
        // one spare byte detects output longer than announced
        zs.next_out = reinterpret_cast<Bytef *>(&overflow);
        zs.avail_out = 1;
      }
      const uInt before = zs.avail_out;
      rc = inflate(&zs, Z_NO_FLUSH);
      const size_t got = before - zs.avail_out;
      if (produced >= expected_size && got > 0) {
        inflateEnd(&zs);
        throw ReadError(fmt::format(
            "gzip: chunk inflates past its declared {} bytes", expected_size));
      }
      produced += got;

      if (rc == Z_STREAM_END) {
        if (zs.avail_in == 0) break;
        // next gzip member
        if (inflateReset(&zs) != Z_OK) break;
        continue;
      }
      if (rc != Z_OK) {
        inflateEnd(&zs);
        throw ReadError(fmt::format("gzip: corrupt chunk ({})",
                                    zs.msg ? zs.msg : "inflate error"));
      }
      if (zs.avail_in == 0 && got == 0) {
        inflateEnd(&zs);
        throw ReadError("gzip: truncated chunk");
      }
    }
    inflateEnd(&zs);

    if (produced != expected_size)
      throw ReadError(fmt::format(
          "gzip: chunk inflated to {} bytes, header says {}", produced,
          expected_size));
    return out;
  }
};

std::unique_ptr<Codec> make_codec_gzip() {
  return std::make_unique<GzipCodec>();
}

} // namespace chunklog
