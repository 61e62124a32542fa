#include <chunklog/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chunklog {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> lg = [] {
    if (auto existing = spdlog::get("chunklog"))
      return existing;
    return spdlog::stderr_color_mt("chunklog");
  }();
  return lg;
}

} // namespace chunklog
