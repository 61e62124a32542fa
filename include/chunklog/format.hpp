#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunklog {

// Compression code stored once in the file header.
enum class Compression : uint8_t { NONE = 0, GZIP = 1, ZSTD = 2 };

struct FormatConst {
  static constexpr char     MAGIC[4] = {'C', 'L', 'O', 'G'};
  static constexpr uint16_t VERSION = 1;
  static constexpr size_t   HEADER_SIZE = 16;
  static constexpr size_t   CHUNK_HEADER_SIZE = 12;

  static constexpr char FIELD_DELIM = '\t';
  static constexpr char RECORD_DELIM = '\n';
  // stands in for '\n' inside a serialized message
  static constexpr char NEWLINE_SENTINEL = '\v';
};

// Header layout (16 bytes, little-endian):
//   [0:4]  magic "CLOG"
//   [4:6]  format version
//   [6:8]  compression code, low byte only; high byte written as 0, ignored
//   [8:16] reserved, zero
struct FileHeader {
  uint16_t    version = FormatConst::VERSION;
  Compression compression = Compression::GZIP;
};

// Precedes every chunk payload (12 bytes, little-endian).
struct ChunkHeader {
  uint32_t compressed_size = 0;
  uint32_t uncompressed_size = 0;
  uint32_t record_count = 0;
};

struct Record {
  std::string timestamp;
  std::string level;
  std::string message;

  bool operator==(const Record &) const = default;
};

using HeaderBytes = std::array<char, FormatConst::HEADER_SIZE>;
using ChunkHeaderBytes = std::array<char, FormatConst::CHUNK_HEADER_SIZE>;

HeaderBytes encode_file_header(Compression c);
// Throws MalformedFileError / UnsupportedCompressionError.
FileHeader decode_file_header(std::string_view bytes);

ChunkHeaderBytes encode_chunk_header(const ChunkHeader &h);
ChunkHeader decode_chunk_header(std::string_view bytes);

bool is_known_compression(uint8_t code);
const char *compression_name(Compression c);
std::optional<Compression> parse_compression(std::string_view name);

// Appends "ts\tlevel\tmessage\n" to out; '\n' in message becomes the sentinel.
void serialize_record(std::string &out, std::string_view timestamp,
                      std::string_view level, std::string_view message);

// One record without its trailing delimiter. nullopt when the field count is
// wrong; ReadError when the bytes are not UTF-8.
std::optional<Record> parse_record(std::string_view bytes);

// Splits a decompressed payload into records, skipping empty fragments and
// malformed records.
std::vector<Record> split_payload(std::string_view payload);

bool is_valid_utf8(std::string_view s);

// Local time, "YYYY-MM-DDTHH:MM:SS.ffffff".
std::string now_timestamp();

} // namespace chunklog
