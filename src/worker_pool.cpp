#include "tbproxy/worker_pool.hpp"
#include "tbproxy/logging.hpp"

#include <boost/thread/lock_guard.hpp>
#include <boost/thread/lock_types.hpp>
#include <exception>

namespace tbproxy {

WorkerPool::WorkerPool(std::string name, std::size_t threads,
                       std::size_t queue_capacity)
    : name_(std::move(name)), threads_(threads ? threads : 1),
      capacity_(queue_capacity ? queue_capacity : 1) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (running_.exchange(true))
    return;

  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(
        std::make_unique<boost::thread>([this] { worker_loop(); }));
  }
  log_dbg("POOL", name_ + ": started " + std::to_string(threads_) + " workers");
}

void WorkerPool::stop() {
  {
    boost::lock_guard<boost::mutex> lk(m_);
    closed_ = true;
  }
  has_job_.notify_all();
  has_room_.notify_all();

  if (!running_.exchange(false))
    return;

  for (auto &w : workers_) {
    if (w && w->joinable())
      w->join();
  }
  workers_.clear();
  log_dbg("POOL", name_ + ": stopped");
}

bool WorkerPool::submit(Job job) { return enqueue(std::move(job), true); }

bool WorkerPool::try_submit(Job job) { return enqueue(std::move(job), false); }

std::size_t WorkerPool::queued() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return jobs_.size();
}

bool WorkerPool::enqueue(Job job, bool wait_for_room) {
  boost::unique_lock<boost::mutex> lk(m_);
  if (wait_for_room) {
    while (!closed_ && jobs_.size() >= capacity_)
      has_room_.wait(lk);
  }
  if (closed_ || jobs_.size() >= capacity_)
    return false;

  jobs_.push_back(std::move(job));
  lk.unlock();
  has_job_.notify_one();
  return true;
}

WorkerPool::Job WorkerPool::take() {
  boost::unique_lock<boost::mutex> lk(m_);
  while (!closed_ && jobs_.empty())
    has_job_.wait(lk);
  if (jobs_.empty())
    return {};

  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  lk.unlock();
  has_room_.notify_one();
  return job;
}

void WorkerPool::worker_loop() {
  while (Job job = take()) {
    try {
      job();
    } catch (const std::exception &e) {
      log_err("POOL", name_ + ": job failed: " + e.what());
    }
  }
}

} // namespace tbproxy
