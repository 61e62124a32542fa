#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace chunklog {

// The library's own diagnostics logger ("chunklog", stderr). Kept apart from
// the default logger so a clog_sink installed there never re-enters a Writer.
std::shared_ptr<spdlog::logger> logger();

} // namespace chunklog
