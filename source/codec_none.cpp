#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>

#include <fmt/format.h>

namespace chunklog {

struct IdentityCodec : Codec {
  const char *name() const override { return "none"; }
  Compression code() const override { return Compression::NONE; }

  std::string compress(std::string_view raw) const override {
    return std::string(raw);
  }

  std::string decompress(std::string_view comp,
                         size_t expected_size) const override {
    if (comp.size() != expected_size)
      throw ReadError(fmt::format(
          "uncompressed chunk holds {} bytes, header says {}", comp.size(),
          expected_size));
    return std::string(comp);
  }
};

std::unique_ptr<Codec> make_codec_none() {
  return std::make_unique<IdentityCodec>();
}

} // namespace chunklog
