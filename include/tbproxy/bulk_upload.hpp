#pragma once
#include "error_normalizer.hpp"
#include "types.hpp"
#include "upstream_client.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tbproxy {

struct BulkUploadConfig {
  std::size_t concurrency = 8;
  std::size_t queue_capacity = 1024;
  std::chrono::milliseconds per_target_timeout{10000};
};

enum class TargetStatus { Success, Failed };

const char *to_string(TargetStatus status) noexcept;

struct TargetOutcome {
  TargetStatus status = TargetStatus::Failed;
  std::vector<std::string> keys_uploaded; // success only
  std::optional<NormalizedError> error;   // failed only
  std::size_t data_points = 0;            // 0 on failure

  // {status, keys_uploaded | error{error_code, message, details?}, data_points}
  nlohmann::json to_json() const;
};

struct BulkSummary {
  std::size_t total_devices = 0;
  std::size_t successful_devices = 0;
  std::size_t failed_devices = 0;
  std::size_t total_data_points = 0;

  bool operator==(const BulkSummary &o) const noexcept {
    return total_devices == o.total_devices &&
           successful_devices == o.successful_devices &&
           failed_devices == o.failed_devices &&
           total_data_points == o.total_data_points;
  }
};

// Immutable result of one bulk run. The summary is derived from the results
// every time it is asked for and is never stored.
class BulkReport {
public:
  explicit BulkReport(std::map<std::string, TargetOutcome> results)
      : results_(std::move(results)) {}

  const std::map<std::string, TargetOutcome> &results() const noexcept {
    return results_;
  }

  BulkSummary summary() const;

  // {status:"completed", summary:{...}, results:{...}, message}
  nlohmann::json to_json() const;

private:
  std::map<std::string, TargetOutcome> results_;
};

// Thrown by run() when the caller's cancellation flag was raised before every
// target resolved.
class RunCancelled : public std::runtime_error {
public:
  RunCancelled() : std::runtime_error("bulk upload cancelled") {}
};

// Fans one bulk request out to the upstream, one job per device, on a bounded
// worker pool, and joins on the results.
//
// Per-device failures (bad samples, upstream errors, timeouts) become that
// device's outcome and never touch another device. Each run owns its state;
// a call that finishes after its run has returned writes into state nobody
// reads any more.
class BulkUploadOrchestrator {
public:
  BulkUploadOrchestrator(UpstreamTelemetryClient &upstream,
                         const ErrorNormalizer &normalizer,
                         BulkUploadConfig cfg = {});
  ~BulkUploadOrchestrator();

  BulkUploadOrchestrator(const BulkUploadOrchestrator &) = delete;
  BulkUploadOrchestrator &operator=(const BulkUploadOrchestrator &) = delete;

  // Throws ApiError for an empty list or repeated target ids, RunCancelled
  // when *cancelled becomes true before completion.
  BulkReport run(const std::vector<UploadTarget> &targets,
                 const std::atomic<bool> *cancelled = nullptr);

  // Structural problem with a target's samples, if any.
  static std::optional<std::string> check_target(const UploadTarget &target);

  std::size_t queued() const { return pool_.queued(); }

  void stop() { pool_.stop(); }

private:
  struct RunState;

  void upload_one(const std::shared_ptr<RunState> &state, std::size_t index);
  TargetOutcome failed(const ErrorCause &cause) const;

  UpstreamTelemetryClient &upstream_;
  const ErrorNormalizer &normalizer_;
  const BulkUploadConfig cfg_;
  WorkerPool pool_;
};

} // namespace tbproxy
