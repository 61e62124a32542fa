#include <chunklog/errors.hpp>
#include <chunklog/format.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstring>
#include <ctime>

namespace chunklog {

// --- little-endian helpers ---
static void put_u16(char *p, uint16_t v) {
  p[0] = static_cast<char>(v & 0xFFu);
  p[1] = static_cast<char>((v >> 8) & 0xFFu);
}

static void put_u32(char *p, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    p[i] = static_cast<char>((v >> (8 * i)) & 0xFFu);
}

static uint16_t get_u16(const char *p) {
  return static_cast<uint16_t>(static_cast<unsigned char>(p[0]) |
                               (static_cast<unsigned char>(p[1]) << 8));
}

static uint32_t get_u32(const char *p) {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i)
    v |= static_cast<uint32_t>(static_cast<unsigned char>(p[i])) << (8 * i);
  return v;
}

HeaderBytes encode_file_header(Compression c) {
  HeaderBytes out{};
  std::memcpy(out.data(), FormatConst::MAGIC, sizeof(FormatConst::MAGIC));
  put_u16(out.data() + 4, FormatConst::VERSION);
  out[6] = static_cast<char>(c);
  return out;
}

FileHeader decode_file_header(std::string_view bytes) {
  if (bytes.size() < FormatConst::HEADER_SIZE)
    throw MalformedFileError(fmt::format(
        "file too short for a header: {} of {} bytes", bytes.size(),
        FormatConst::HEADER_SIZE));
  if (std::memcmp(bytes.data(), FormatConst::MAGIC,
                  sizeof(FormatConst::MAGIC)) != 0)
    throw MalformedFileError("not a clog file: bad magic");

  FileHeader h{};
  h.version = get_u16(bytes.data() + 4);
  if (h.version != FormatConst::VERSION)
    throw MalformedFileError(fmt::format("unsupported format version {}",
                                         h.version));

  const auto code = static_cast<uint8_t>(bytes[6]);
  if (!is_known_compression(code))
    throw UnsupportedCompressionError(
        fmt::format("unknown compression code {}", code));
  h.compression = static_cast<Compression>(code);
  return h;
}

ChunkHeaderBytes encode_chunk_header(const ChunkHeader &h) {
  ChunkHeaderBytes out{};
  put_u32(out.data(), h.compressed_size);
  put_u32(out.data() + 4, h.uncompressed_size);
  put_u32(out.data() + 8, h.record_count);
  return out;
}

ChunkHeader decode_chunk_header(std::string_view bytes) {
  if (bytes.size() < FormatConst::CHUNK_HEADER_SIZE)
    throw MalformedFileError("truncated chunk header");
  ChunkHeader h{};
  h.compressed_size = get_u32(bytes.data());
  h.uncompressed_size = get_u32(bytes.data() + 4);
  h.record_count = get_u32(bytes.data() + 8);
  return h;
}

bool is_known_compression(uint8_t code) {
  return code <= static_cast<uint8_t>(Compression::ZSTD);
}

const char *compression_name(Compression c) {
  switch (c) {
  case Compression::NONE: return "none";
  case Compression::GZIP: return "gzip";
  case Compression::ZSTD: return "zstd";
  }
  return "unknown";
}

std::optional<Compression> parse_compression(std::string_view name) {
  if (name == "none") return Compression::NONE;
  if (name == "gzip") return Compression::GZIP;
  if (name == "zstd") return Compression::ZSTD;
  return std::nullopt;
}

void serialize_record(std::string &out, std::string_view timestamp,
                      std::string_view level, std::string_view message) {
  out.reserve(out.size() + timestamp.size() + level.size() + message.size() + 3);
  out.append(timestamp);
  out.push_back(FormatConst::FIELD_DELIM);
  out.append(level);
  out.push_back(FormatConst::FIELD_DELIM);
  for (char c : message)
    out.push_back(c == '\n' ? FormatConst::NEWLINE_SENTINEL : c);
  out.push_back(FormatConst::RECORD_DELIM);
}

std::optional<Record> parse_record(std::string_view bytes) {
  if (!is_valid_utf8(bytes))
    throw ReadError("record is not valid UTF-8");

  const auto p1 = bytes.find(FormatConst::FIELD_DELIM);
  if (p1 == std::string_view::npos) return std::nullopt;
  const auto p2 = bytes.find(FormatConst::FIELD_DELIM, p1 + 1);
  if (p2 == std::string_view::npos) return std::nullopt;

  Record r;
  r.timestamp.assign(bytes.substr(0, p1));
  r.level.assign(bytes.substr(p1 + 1, p2 - p1 - 1));
  r.message.assign(bytes.substr(p2 + 1));
  for (auto &c : r.message)
    if (c == FormatConst::NEWLINE_SENTINEL) c = '\n';
  return r;
}

std::vector<Record> split_payload(std::string_view payload) {
  std::vector<Record> out;
  size_t pos = 0;
  while (pos < payload.size()) {
    auto end = payload.find(FormatConst::RECORD_DELIM, pos);
    if (end == std::string_view::npos) end = payload.size();
    if (end > pos) {
      if (auto r = parse_record(payload.substr(pos, end - pos)))
        out.push_back(std::move(*r));
    }
    pos = end + 1;
  }
  return out;
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  const size_t n = s.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) { ++i; continue; }

    size_t len = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;
    if (i + len > n) return false;

    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

std::string now_timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto us =
      duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", tm, us);
}

} // namespace chunklog
