// source/codec_zstd.cpp
#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>

#include <fmt/format.h>
#include <zstd.h>

#include <algorithm>
#include <memory>

namespace chunklog {

static constexpr int ZSTD_LEVEL = 3;
// initial and minimum growth of the decode buffer
static constexpr size_t DECODE_STEP = 64 * 1024;

struct ZstdCodec : Codec {
  const char *name() const override { return "zstd"; }
  Compression code() const override { return Compression::ZSTD; }

  std::string compress(std::string_view raw) const override {
    std::string out;
    out.resize(ZSTD_compressBound(raw.size()));
    const size_t n =
        ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), ZSTD_LEVEL);
    if (ZSTD_isError(n))
      throw WriteError(
          fmt::format("zstd: compress failed: {}", ZSTD_getErrorName(n)));
    out.resize(n);
    return out;
  }

  // Streaming decode into a buffer that grows with the output actually
  // produced, so neither the chunk header nor the frame header can force a
  // large allocation on their own.
  std::string decompress(std::string_view comp,
                         size_t expected_size) const override {
    const unsigned long long frame = ZSTD_getFrameContentSize(comp.data(), comp.size());
    if (frame == ZSTD_CONTENTSIZE_ERROR)
      throw ReadError("zstd: not a zstd frame");
    if (frame != ZSTD_CONTENTSIZE_UNKNOWN && frame != expected_size)
      throw ReadError(fmt::format(
          "zstd: frame holds {} bytes, header says {}", frame, expected_size));

    std::unique_ptr<ZSTD_DCtx, size_t (*)(ZSTD_DCtx *)> dctx(ZSTD_createDCtx(),
                                                            ZSTD_freeDCtx);
    if (!dctx) throw ReadError("zstd: cannot allocate a decompression context");

    std::string out;
    out.resize(std::min(expected_size, DECODE_STEP));
    ZSTD_inBuffer in{comp.data(), comp.size(), 0};
    size_t produced = 0;
    size_t rc = 1;
    char overflow = 0;

    while (rc != 0) {
      if (produced == out.size() && out.size() < expected_size) {
        const size_t grow = std::max(out.size(), DECODE_STEP);
        out.resize(std::min(expected_size, out.size() + grow));
      }
      ZSTD_outBuffer ob{};
      if (produced < out.size()) {
        ob = {out.data() + produced, out.size() - produced, 0};
      } else {
        // one spare byte detects output longer than announced
        ob = {&overflow, 1, 0};
      }
      const size_t in_before = in.pos;
      rc = ZSTD_decompressStream(dctx.get(), &ob, &in);
      if (ZSTD_isError(rc))
        throw ReadError(
            fmt::format("zstd: corrupt chunk: {}", ZSTD_getErrorName(rc)));
      if (produced >= expected_size && ob.pos > 0)
        throw ReadError(fmt::format(
            "zstd: chunk decompresses past its declared {} bytes", expected_size));
      produced += ob.pos;
      if (rc != 0 && ob.pos == 0 && in.pos == in_before)
        throw ReadError("zstd: truncated chunk");
    }

    if (in.pos != in.size)
      throw ReadError("zstd: trailing bytes after the frame");
    if (produced != expected_size)
      throw ReadError(fmt::format(
          "zstd: chunk decompressed to {} bytes, header says {}", produced,
          expected_size));
    out.resize(produced);
    return out;
  }
};

std::unique_ptr<Codec> make_codec_zstd() {
  return std::make_unique<ZstdCodec>();
}

} // namespace chunklog
