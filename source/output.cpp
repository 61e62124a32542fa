#include <chunklog/codec.hpp>
#include <chunklog/errors.hpp>
#include <chunklog/log.hpp>
#include <chunklog/output.hpp>

#include <fmt/format.h>
#include <zlib.h>
#ifdef CHUNKLOG_HAVE_ZSTD
#include <zstd.h>
#endif

#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace chunklog {

namespace {

class PlainOutput : public OutputFile {
public:
  explicit PlainOutput(const fs::path &p) : path_(p), out_(p, std::ios::binary | std::ios::trunc) {
    if (!out_)
      throw WriteError(fmt::format("cannot create {}", path_.string()));
  }
  ~PlainOutput() override {
    try {
      close();
    } catch (const Error &e) {
      logger()->error("{}", e.what());
    }
  }
  void write(std::string_view data) override {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out_)
      throw WriteError(fmt::format("write to {} failed", path_.string()));
  }
  void close() override {
    if (!out_.is_open()) return;
    out_.close();
    if (!out_)
      throw WriteError(fmt::format("close {} failed", path_.string()));
  }

private:
  fs::path      path_;
  std::ofstream out_;
};

class GzipOutput : public OutputFile {
public:
  explicit GzipOutput(const fs::path &p) : path_(p) {
    gz_ = gzopen(p.c_str(), "wb");
    if (!gz_)
      throw WriteError(fmt::format("cannot create compressed file {}", path_.string()));
  }
  ~GzipOutput() override {
    try {
      close();
    } catch (const Error &e) {
      logger()->error("{}", e.what());
    }
  }
  void write(std::string_view data) override {
    if (data.empty()) return;
    const int w = gzwrite(gz_, data.data(), static_cast<unsigned>(data.size()));
    if (w <= 0 || static_cast<size_t>(w) != data.size())
      throw WriteError(fmt::format("gzwrite to {} failed", path_.string()));
  }
  void close() override {
    if (!gz_) return;
    const int rc = gzclose(gz_);
    gz_ = nullptr;
    if (rc != Z_OK)
      throw WriteError(fmt::format("gzclose {} failed ({})", path_.string(), rc));
  }

private:
  fs::path path_;
  gzFile   gz_ = nullptr;
};

#ifdef CHUNKLOG_HAVE_ZSTD
class ZstdOutput : public OutputFile {
public:
  explicit ZstdOutput(const fs::path &p)
      : path_(p), out_(p, std::ios::binary | std::ios::trunc) {
    if (!out_)
      throw WriteError(fmt::format("cannot create {}", path_.string()));
    cs_ = ZSTD_createCStream();
    if (!cs_)
      throw WriteError("zstd: cannot allocate a compression stream");
    const size_t rc = ZSTD_initCStream(cs_, 3);
    if (ZSTD_isError(rc)) {
      ZSTD_freeCStream(cs_);
      cs_ = nullptr;
      throw WriteError(fmt::format("zstd: {}", ZSTD_getErrorName(rc)));
    }
    buf_.resize(ZSTD_CStreamOutSize());
  }
  ~ZstdOutput() override {
    try {
      close();
    } catch (const Error &e) {
      logger()->error("{}", e.what());
    }
    if (cs_) ZSTD_freeCStream(cs_);
  }
  void write(std::string_view data) override {
    ZSTD_inBuffer in{data.data(), data.size(), 0};
    while (in.pos < in.size) {
      ZSTD_outBuffer o{buf_.data(), buf_.size(), 0};
      const size_t rc = ZSTD_compressStream(cs_, &o, &in);
      if (ZSTD_isError(rc))
        throw WriteError(fmt::format("zstd: {}", ZSTD_getErrorName(rc)));
      emit(o.pos);
    }
  }
  void close() override {
    if (!out_.is_open()) return;
    for (;;) {
      ZSTD_outBuffer o{buf_.data(), buf_.size(), 0};
      const size_t left = ZSTD_endStream(cs_, &o);
      if (ZSTD_isError(left)) {
        out_.close();
        throw WriteError(fmt::format("zstd: {}", ZSTD_getErrorName(left)));
      }
      emit(o.pos);
      if (left == 0) break;
    }
    out_.close();
    if (!out_)
      throw WriteError(fmt::format("close {} failed", path_.string()));
  }

private:
  void emit(size_t n) {
    if (n == 0) return;
    out_.write(buf_.data(), static_cast<std::streamsize>(n));
    if (!out_)
      throw WriteError(fmt::format("write to {} failed", path_.string()));
  }

  fs::path       path_;
  std::ofstream  out_;
  ZSTD_CStream  *cs_ = nullptr;
  std::string    buf_;
};
#endif

} // namespace

std::unique_ptr<OutputFile> open_output(const fs::path &path, Compression c) {
  if (!codec_available(c))
    throw UnsupportedCompressionError(fmt::format(
        "{} output is not available in this build", compression_name(c)));

  switch (c) {
  case Compression::NONE: return std::make_unique<PlainOutput>(path);
  case Compression::GZIP: return std::make_unique<GzipOutput>(path);
  case Compression::ZSTD:
#ifdef CHUNKLOG_HAVE_ZSTD
    return std::make_unique<ZstdOutput>(path);
#else
    break;
#endif
  }
  throw UnsupportedCompressionError(
      fmt::format("unknown compression code {}", static_cast<unsigned>(c)));
}

} // namespace chunklog
