#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>

#include <fmt/format.h>

namespace chunklog {

// provided by each codec TU
std::unique_ptr<Codec> make_codec_none();
std::unique_ptr<Codec> make_codec_gzip();
#ifdef CHUNKLOG_HAVE_ZSTD
std::unique_ptr<Codec> make_codec_zstd();
#endif

bool codec_available(Compression c) {
  switch (c) {
  case Compression::NONE:
  case Compression::GZIP:
    return true;
  case Compression::ZSTD:
#ifdef CHUNKLOG_HAVE_ZSTD
    return true;
#else
    return false;
#endif
  }
  return false;
}

std::unique_ptr<Codec> make_codec(Compression c) {
  if (!is_known_compression(static_cast<uint8_t>(c)))
    throw UnsupportedCompressionError(fmt::format(
        "unknown compression code {}", static_cast<unsigned>(c)));
  if (!codec_available(c))
    throw UnsupportedCompressionError(fmt::format(
        "{} compression is not available in this build", compression_name(c)));

  switch (c) {
  case Compression::NONE: return make_codec_none();
  case Compression::GZIP: return make_codec_gzip();
  case Compression::ZSTD:
#ifdef CHUNKLOG_HAVE_ZSTD
    return make_codec_zstd();
#else
    break;
#endif
  }
  return {};
}

} // namespace chunklog
