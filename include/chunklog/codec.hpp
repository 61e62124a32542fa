#pragma once
#include <chunklog/format.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace chunklog {

struct Codec {
  virtual ~Codec() = default;

  virtual const char *name() const = 0;
  virtual Compression code() const = 0;

  // Throws WriteError on failure.
  virtual std::string compress(std::string_view raw) const = 0;

  // Output must be exactly expected_size bytes; throws ReadError otherwise
  // or when the input is corrupt.
  virtual std::string decompress(std::string_view comp,
                                 size_t expected_size) const = 0;
};

// Whether this build provides the codec (zstd is optional).
bool codec_available(Compression c);

// Throws UnsupportedCompressionError for unknown or unavailable codecs.
std::unique_ptr<Codec> make_codec(Compression c);

} // namespace chunklog
