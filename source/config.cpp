#include <chunklog/config.hpp>
#include <chunklog/errors.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>

namespace chunklog {

std::optional<bool> parse_switch(std::string_view s) {
  if (s == "on" || s == "true" || s == "1") return true;
  if (s == "off" || s == "false" || s == "0") return false;
  return std::nullopt;
}

std::optional<uint64_t> parse_u64(std::string_view s) {
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty())
    return std::nullopt;
  return v;
}

static uint64_t env_u64(const char *name, const char *value) {
  auto v = parse_u64(value);
  if (!v)
    throw ConfigurationError(
        fmt::format("{}: expected a non-negative integer, got '{}'", name, value));
  return *v;
}

void apply_env(WriterOptions &opts) {
  if (const char *e = std::getenv("CHUNKLOG_COMPRESSION")) {
    auto c = parse_compression(e);
    if (!c)
      throw ConfigurationError(fmt::format(
          "CHUNKLOG_COMPRESSION: expected none|gzip|zstd, got '{}'", e));
    opts.compression = *c;
  }
  if (const char *e = std::getenv("CHUNKLOG_FLUSH_BYTES"))
    opts.flush_bytes = env_u64("CHUNKLOG_FLUSH_BYTES", e);
  if (const char *e = std::getenv("CHUNKLOG_FLUSH_RECORDS"))
    opts.flush_records = env_u64("CHUNKLOG_FLUSH_RECORDS", e);
  if (const char *e = std::getenv("CHUNKLOG_FLUSH_INTERVAL_MS"))
    opts.flush_interval =
        std::chrono::milliseconds(env_u64("CHUNKLOG_FLUSH_INTERVAL_MS", e));
  if (const char *e = std::getenv("CHUNKLOG_SYNC")) {
    auto b = parse_switch(e);
    if (!b)
      throw ConfigurationError(
          fmt::format("CHUNKLOG_SYNC: expected on|off, got '{}'", e));
    opts.sync_on_flush = *b;
  }
}

} // namespace chunklog
