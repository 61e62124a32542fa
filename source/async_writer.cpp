#include <chunklog/async_writer.hpp>
#include <chunklog/errors.hpp>
#include <chunklog/log.hpp>

#include <cstdlib>
#include <set>

namespace chunklog {

// --- process exit hook: registered once, stops every live AsyncWriter ---
namespace {

std::mutex &live_mu() {
  static std::mutex m;
  return m;
}

std::set<AsyncWriter *> &live_set() {
  static std::set<AsyncWriter *> s;
  return s;
}

void stop_all_at_exit() {
  std::set<AsyncWriter *> snapshot;
  {
    std::lock_guard<std::mutex> lk(live_mu());
    snapshot = live_set();
  }
  for (auto *w : snapshot)
    w->stop();
}

void register_live(AsyncWriter *w) {
  static std::once_flag hook_once;
  std::call_once(hook_once, [] {
    // construct the registry first so it outlives the hook
    (void)live_mu();
    (void)live_set();
    (void)logger();
    if (std::atexit(stop_all_at_exit) != 0)
      logger()->warn("could not register the async writer exit hook");
  });
  std::lock_guard<std::mutex> lk(live_mu());
  live_set().insert(w);
}

void unregister_live(AsyncWriter *w) {
  std::lock_guard<std::mutex> lk(live_mu());
  live_set().erase(w);
}

} // namespace

AsyncWriter::AsyncWriter(std::shared_ptr<Writer> writer, const AsyncOptions &opts)
    : writer_(std::move(writer)), opts_(opts) {
  if (!writer_)
    throw ConfigurationError("async writer: null writer");
  if (opts_.queue_capacity == 0)
    throw ConfigurationError("async writer: queue capacity must be positive");

  worker_ = std::thread([this] { run(); });
  if (opts_.register_exit_hook)
    register_live(this);
}

AsyncWriter::~AsyncWriter() {
  if (opts_.register_exit_hook)
    unregister_live(this);
  stop();
}

bool AsyncWriter::submit(std::string level, std::string message) {
  std::unique_lock<std::mutex> lk(mu_);
  not_full_.wait(lk, [&] { return stopping_ || q_.size() < opts_.queue_capacity; });
  if (stopping_) return false;
  q_.push_back(Item{std::move(level), std::move(message)});
  lk.unlock();
  not_empty_.notify_one();
  return true;
}

void AsyncWriter::run() {
  for (;;) {
    Item item;
    {
      std::unique_lock<std::mutex> lk(mu_);
      not_empty_.wait(lk, [&] { return stopping_ || !q_.empty(); });
      if (q_.empty()) return; // stopping and drained
      item = std::move(q_.front());
      q_.pop_front();
    }
    not_full_.notify_one();

    try {
      writer_->write_record(item.level, item.message);
    } catch (const Error &e) {
      ++failed_writes_;
      logger()->error("async write to {} failed: {}", writer_->path().string(),
                      e.what());
    }
  }
}

void AsyncWriter::stop() {
  std::call_once(stop_once_, [this] {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (worker_.joinable()) worker_.join();

    try {
      writer_->close();
    } catch (const Error &e) {
      ++failed_writes_;
      logger()->error("closing {} after drain failed: {}",
                      writer_->path().string(), e.what());
    }
  });
}

size_t AsyncWriter::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

} // namespace chunklog
