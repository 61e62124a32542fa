#include <chunklog/errors.hpp>
#include <chunklog/log.hpp>
#include <chunklog/rotation.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using Clock = std::chrono::system_clock;

namespace chunklog {

// "YYYY-MM-DD_HH-MM-SS"
static constexpr size_t STAMP_LEN = 19;

static std::string archive_stamp(Clock::time_point tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return fmt::format("{:%Y-%m-%d_%H-%M-%S}", tm);
}

static bool looks_like_stamp(std::string_view s) {
  if (s.size() != STAMP_LEN) return false;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (i == 4 || i == 7 || i == 13 || i == 16) {
      if (c != '-') return false;
    } else if (i == 10) {
      if (c != '_') return false;
    } else if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

static fs::path with_suffix(const fs::path &base, const std::string &suffix) {
  fs::path p = base;
  p += "." + suffix;
  return p;
}

static void rename_or_throw(const fs::path &from, const fs::path &to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec)
    throw WriteError(fmt::format("rename {} -> {} failed: {}", from.string(),
                                 to.string(), ec.message()));
}

RotatingWriter::RotatingWriter(const fs::path &path, const RotationOptions &opts)
    : path_(path), opts_(opts) {
  if (opts_.when == RotateWhen::TIME && opts_.interval.count() <= 0)
    throw ConfigurationError("rotation interval must be positive");
  if (opts_.when == RotateWhen::SIZE && opts_.max_bytes <= FormatConst::HEADER_SIZE)
    throw ConfigurationError("rotation size must exceed the file header");

  const auto now = Clock::now();
  period_start_ = now;
  // an appended file keeps the period it was last written in
  struct stat st {};
  if (opts_.writer.mode == OpenMode::APPEND && ::stat(path_.c_str(), &st) == 0)
    period_start_ = std::min(now, Clock::from_time_t(st.st_mtime));
  next_rollover_ = period_start_ + opts_.interval;

  writer_ = std::make_unique<Writer>(path_, opts_.writer);
}

RotatingWriter::~RotatingWriter() {
  try {
    close();
  } catch (const Error &e) {
    logger()->error("rotating writer close failed for {}: {}", path_.string(),
                    e.what());
  }
}

bool RotatingWriter::should_rotate_locked(Clock::time_point now) const {
  if (opts_.when == RotateWhen::TIME)
    return now >= next_rollover_;

  const uint64_t on_disk = writer_->file_size();
  const uint64_t buffered = writer_->buffered_bytes();
  // never rotate a file that holds no records yet
  if (on_disk <= FormatConst::HEADER_SIZE && buffered == 0) return false;
  return on_disk + buffered >= opts_.max_bytes;
}

void RotatingWriter::write_record(std::string_view level, std::string_view message) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!writer_)
    throw WriteError(fmt::format("rotating writer for {} is closed", path_.string()));

  const auto now = Clock::now();
  if (should_rotate_locked(now))
    rotate_locked(now);
  writer_->write_record(level, message);
}

void RotatingWriter::flush() {
  std::lock_guard<std::mutex> lk(mu_);
  if (writer_) writer_->flush();
}

void RotatingWriter::rotate() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!writer_)
    throw WriteError(fmt::format("rotating writer for {} is closed", path_.string()));
  rotate_locked(Clock::now());
}

void RotatingWriter::rotate_locked(Clock::time_point now) {
  // the handle is released even when the final flush fails
  std::optional<WriteError> close_err;
  try {
    writer_->close();
  } catch (const WriteError &e) {
    close_err = e;
  }

  if (opts_.when == RotateWhen::TIME)
    archive_timestamped_locked();
  else
    shift_numbered_locked();

  WriterOptions wo = opts_.writer;
  wo.mode = OpenMode::CREATE;
  writer_ = std::make_unique<Writer>(path_, wo);

  period_start_ = now;
  next_rollover_ = now + opts_.interval;
  logger()->info("rotated {}", path_.string());

  if (close_err) throw *close_err;
}

void RotatingWriter::shift_numbered_locked() {
  std::error_code ec;
  if (opts_.backup_count == 0) {
    fs::remove(path_, ec);
    if (ec)
      throw WriteError(fmt::format("remove {} failed: {}", path_.string(), ec.message()));
    return;
  }

  for (size_t i = opts_.backup_count - 1; i >= 1; --i) {
    const fs::path src = with_suffix(path_, std::to_string(i));
    const fs::path dst = with_suffix(path_, std::to_string(i + 1));
    if (fs::exists(src, ec))
      rename_or_throw(src, dst);
  }
  rename_or_throw(path_, with_suffix(path_, "1"));
}

void RotatingWriter::archive_timestamped_locked() {
  auto stamp_tp = period_start_;
  fs::path dst = with_suffix(path_, archive_stamp(stamp_tp));
  std::error_code ec;
  while (fs::exists(dst, ec)) {
    stamp_tp += std::chrono::seconds(1);
    dst = with_suffix(path_, archive_stamp(stamp_tp));
  }
  rename_or_throw(path_, dst);

  if (opts_.backup_count == 0) return;
  auto olds = archives();
  while (olds.size() > opts_.backup_count) {
    fs::remove(olds.front(), ec);
    if (ec)
      throw WriteError(fmt::format("remove {} failed: {}",
                                   olds.front().string(), ec.message()));
    logger()->debug("removed old archive {}", olds.front().string());
    olds.erase(olds.begin());
  }
}

std::vector<fs::path> RotatingWriter::archives() const {
  std::vector<fs::path> out;
  std::error_code ec;

  if (opts_.when == RotateWhen::SIZE) {
    for (size_t i = opts_.backup_count; i >= 1; --i) {
      fs::path p = with_suffix(path_, std::to_string(i));
      if (fs::exists(p, ec)) out.push_back(std::move(p));
    }
    return out;
  }

  const fs::path dir = path_.has_parent_path() ? path_.parent_path() : fs::path(".");
  const std::string prefix = path_.filename().string() + ".";
  for (const auto &e : fs::directory_iterator(dir, ec)) {
    const std::string name = e.path().filename().string();
    if (name.size() == prefix.size() + STAMP_LEN &&
        name.compare(0, prefix.size(), prefix) == 0 &&
        looks_like_stamp(std::string_view(name).substr(prefix.size())))
      out.push_back(e.path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

void RotatingWriter::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!writer_) return;
  auto w = std::move(writer_);
  w->close();
}

} // namespace chunklog
