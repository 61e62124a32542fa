#pragma once
#include <chunklog/writer.hpp>

#include <optional>
#include <string_view>

namespace chunklog {

// Environment overrides for WriterOptions:
//   CHUNKLOG_COMPRESSION        none|gzip|zstd
//   CHUNKLOG_FLUSH_BYTES        bytes
//   CHUNKLOG_FLUSH_RECORDS      records
//   CHUNKLOG_FLUSH_INTERVAL_MS  milliseconds
//   CHUNKLOG_SYNC               on|off
// Unset variables leave the field alone; bad values throw ConfigurationError.
void apply_env(WriterOptions &opts);

std::optional<bool> parse_switch(std::string_view s);
std::optional<uint64_t> parse_u64(std::string_view s);

} // namespace chunklog
