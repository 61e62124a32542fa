#pragma once
#include <chunklog/writer.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chunklog {

struct AsyncOptions {
  size_t queue_capacity = 10000;
  // stop() this writer from a process-wide std::atexit hook
  bool register_exit_hook = true;
};

// Moves write_record() off the caller's thread: records go through a bounded
// queue to one consumer thread that owns all Writer I/O.
class AsyncWriter {
public:
  AsyncWriter(std::shared_ptr<Writer> writer, const AsyncOptions &opts = {});
  ~AsyncWriter();

  AsyncWriter(const AsyncWriter &) = delete;
  AsyncWriter &operator=(const AsyncWriter &) = delete;

  // Blocks while the queue is full. False once stop() has begun.
  bool submit(std::string level, std::string message);

  // Drains the queue, closes the Writer, joins the worker. Idempotent.
  void stop();

  size_t pending() const;
  uint64_t failed_writes() const noexcept { return failed_writes_.load(); }
  const std::shared_ptr<Writer> &writer() const { return writer_; }

private:
  struct Item {
    std::string level;
    std::string message;
  };

  void run();

  std::shared_ptr<Writer> writer_;
  AsyncOptions            opts_;

  mutable std::mutex      mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Item>        q_;
  bool                    stopping_ = false;

  std::once_flag        stop_once_;
  std::atomic<uint64_t> failed_writes_{0};
  std::thread           worker_;
};

} // namespace chunklog
