#pragma once
#include <chunklog/writer.hpp>

#include <spdlog/details/null_mutex.h>
#include <spdlog/details/synchronous_factory.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace chunklog {
namespace sinks {

inline std::string_view level_name(spdlog::level::level_enum lvl) {
  switch (lvl) {
  case spdlog::level::trace:    return "TRACE";
  case spdlog::level::debug:    return "DEBUG";
  case spdlog::level::info:     return "INFO";
  case spdlog::level::warn:     return "WARNING";
  case spdlog::level::err:      return "ERROR";
  case spdlog::level::critical: return "CRITICAL";
  default:                      return "NOTSET";
  }
}

// spdlog sink that stores each log message as one .clog record. The sink's
// formatter produces the message text (pattern "%v" unless changed); the
// level goes into the record's level field.
template <typename Mutex>
class clog_sink final : public spdlog::sinks::base_sink<Mutex> {
public:
  explicit clog_sink(std::shared_ptr<Writer> writer)
      : writer_(std::move(writer)) {
    this->set_pattern("%v");
  }

  clog_sink(const std::filesystem::path &path, const WriterOptions &opts)
      : clog_sink(std::make_shared<Writer>(path, opts)) {}

  const std::shared_ptr<Writer> &writer() const { return writer_; }

protected:
  void sink_it_(const spdlog::details::log_msg &msg) override {
    spdlog::memory_buf_t formatted;
    this->formatter_->format(msg, formatted);

    std::string_view text(formatted.data(), formatted.size());
    if (!text.empty() && text.back() == '\n') text.remove_suffix(1);
    if (!text.empty() && text.back() == '\r') text.remove_suffix(1);

    writer_->write_record(level_name(msg.level), text);
  }

  void flush_() override { writer_->flush(); }

private:
  std::shared_ptr<Writer> writer_;
};

using clog_sink_mt = clog_sink<std::mutex>;
using clog_sink_st = clog_sink<spdlog::details::null_mutex>;

} // namespace sinks

template <typename Factory = spdlog::synchronous_factory>
inline std::shared_ptr<spdlog::logger>
clog_logger_mt(const std::string &logger_name, const std::filesystem::path &path,
               const WriterOptions &opts = WriterOptions{.mode = OpenMode::APPEND}) {
  auto lg = Factory::template create<sinks::clog_sink_mt>(logger_name, path, opts);
  // registration installs the global pattern; records keep the bare message
  lg->set_pattern("%v");
  return lg;
}

template <typename Factory = spdlog::synchronous_factory>
inline std::shared_ptr<spdlog::logger>
clog_logger_st(const std::string &logger_name, const std::filesystem::path &path,
               const WriterOptions &opts = WriterOptions{.mode = OpenMode::APPEND}) {
  auto lg = Factory::template create<sinks::clog_sink_st>(logger_name, path, opts);
  // registration installs the global pattern; records keep the bare message
  lg->set_pattern("%v");
  return lg;
}

} // namespace chunklog
