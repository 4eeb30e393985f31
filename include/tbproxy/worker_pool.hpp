#pragma once
#include <atomic>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tbproxy {

// Fixed set of boost::thread workers draining a bounded FIFO of jobs.
// Used twice: once for inbound requests, once for per-device upstream calls.
//
// After stop() no job is accepted, but every job already queued still runs
// before the workers exit.
class WorkerPool {
public:
  using Job = std::function<void()>;

  WorkerPool(std::string name, std::size_t threads, std::size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void start();
  void stop();

  // Blocks while the queue is full. false once stopped.
  bool submit(Job job);
  // false when full or stopped.
  bool try_submit(Job job);

  std::size_t queued() const;
  std::size_t threads() const noexcept { return threads_; }

private:
  bool enqueue(Job job, bool wait_for_room);
  // Empty job once stopped and drained.
  Job take();
  void worker_loop();

  const std::string name_;
  const std::size_t threads_;
  const std::size_t capacity_;

  mutable boost::mutex m_;
  boost::condition_variable has_job_;
  boost::condition_variable has_room_;
  std::deque<Job> jobs_;
  bool closed_ = false;

  std::vector<std::unique_ptr<boost::thread>> workers_;
  std::atomic<bool> running_{false};
};

} // namespace tbproxy
