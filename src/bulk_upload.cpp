#include "tbproxy/bulk_upload.hpp"
#include "tbproxy/logging.hpp"
#include "tbproxy/metrics_export.hpp"

#include <algorithm>
#include <boost/chrono.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <cstdint>
#include <set>

using json = nlohmann::json;

namespace tbproxy {

namespace {

// Upper bound on how long run() sleeps before re-checking cancellation.
constexpr auto kPollInterval = std::chrono::milliseconds(100);

bool is_positive_integer(const json &v) {
  if (v.is_number_unsigned())
    return v.get<std::uint64_t>() > 0;
  if (v.is_number_integer())
    return v.get<std::int64_t>() > 0;
  return false;
}

} // namespace

const char *to_string(TargetStatus status) noexcept {
  return status == TargetStatus::Success ? "success" : "failed";
}

json TargetOutcome::to_json() const {
  json j;
  j["status"] = to_string(status);
  if (status == TargetStatus::Success) {
    j["keys_uploaded"] = keys_uploaded;
  } else if (error) {
    json e;
    e["error_code"] = tbproxy::to_string(error->code);
    e["message"] = error->message;
    if (!error->details.empty())
      e["details"] = error->details;
    j["error"] = std::move(e);
  }
  j["data_points"] = data_points;
  return j;
}

BulkSummary BulkReport::summary() const {
  BulkSummary s;
  s.total_devices = results_.size();
  for (const auto &kv : results_) {
    if (kv.second.status == TargetStatus::Success) {
      ++s.successful_devices;
      s.total_data_points += kv.second.data_points;
    } else {
      ++s.failed_devices;
    }
  }
  return s;
}

json BulkReport::to_json() const {
  const BulkSummary s = summary();

  json results = json::object();
  for (const auto &kv : results_)
    results[kv.first] = kv.second.to_json();

  json j;
  j["status"] = "completed";
  j["summary"] = {{"total_devices", s.total_devices},
                  {"successful_devices", s.successful_devices},
                  {"failed_devices", s.failed_devices},
                  {"total_data_points", s.total_data_points}};
  j["results"] = std::move(results);
  j["message"] = "Bulk upload completed: " +
                 std::to_string(s.successful_devices) + "/" +
                 std::to_string(s.total_devices) + " devices successful";
  return j;
}

struct BulkUploadOrchestrator::RunState {
  struct Slot {
    std::optional<TargetOutcome> outcome;
    std::optional<std::chrono::steady_clock::time_point> started;
  };

  explicit RunState(std::vector<UploadTarget> t)
      : targets(std::move(t)), slots(targets.size()),
        unresolved(targets.size()) {}

  // First resolution wins; later ones (late upstream replies after a
  // timeout, anything after the run returned) are dropped. Caller holds m.
  void resolve(std::size_t i, TargetOutcome o) {
    if (abandoned || slots[i].outcome)
      return;
    slots[i].outcome = std::move(o);
    --unresolved;
  }

  const std::vector<UploadTarget> targets;
  std::vector<Slot> slots;
  std::size_t unresolved;
  bool abandoned = false;

  boost::mutex m;
  boost::condition_variable cv;
};

BulkUploadOrchestrator::BulkUploadOrchestrator(
    UpstreamTelemetryClient &upstream, const ErrorNormalizer &normalizer,
    BulkUploadConfig cfg)
    : upstream_(upstream), normalizer_(normalizer), cfg_(cfg),
      pool_("upload", cfg.concurrency, cfg.queue_capacity) {
  if (cfg_.per_target_timeout <= std::chrono::milliseconds::zero())
    throw std::invalid_argument("per-target timeout must be positive");
  pool_.start();
}

BulkUploadOrchestrator::~BulkUploadOrchestrator() { pool_.stop(); }

std::optional<std::string>
BulkUploadOrchestrator::check_target(const UploadTarget &target) {
  if (target.payload.empty())
    return std::string("payload has no telemetry keys");

  for (const auto &[key, samples] : target.payload) {
    if (key.empty())
      return std::string("empty telemetry key");
    if (samples.empty())
      return "no samples for key '" + abbreviate(key) + "'";
    for (const auto &s : samples) {
      if (!is_positive_integer(s.ts))
        return "timestamp for key '" + abbreviate(key) +
               "' is not a positive integer";
      if (s.value.is_null() || s.value.is_discarded())
        return "value for key '" + abbreviate(key) + "' is null";
    }
  }
  return std::nullopt;
}

TargetOutcome BulkUploadOrchestrator::failed(const ErrorCause &cause) const {
  TargetOutcome o;
  o.status = TargetStatus::Failed;
  o.error = normalizer_.normalize(cause);
  o.data_points = 0;
  return o;
}

BulkReport BulkUploadOrchestrator::run(const std::vector<UploadTarget> &targets,
                                       const std::atomic<bool> *cancelled) {
  if (targets.empty())
    throw ApiError(cause::EmptyRequest{});

  std::set<std::string> seen;
  for (const auto &t : targets) {
    if (!seen.insert(t.target_id).second)
      throw ApiError(
          cause::SchemaViolation{"duplicate target id: " +
                                 abbreviate(t.target_id)});
  }

  // The caller may already have gone away while the request sat in a queue.
  if (cancelled && cancelled->load(std::memory_order_acquire))
    throw RunCancelled();

  auto state = std::make_shared<RunState>(targets);

  std::vector<std::size_t> to_upload;
  to_upload.reserve(targets.size());
  {
    boost::lock_guard<boost::mutex> lk(state->m);
    for (std::size_t i = 0; i < targets.size(); ++i) {
      if (auto problem = check_target(targets[i])) {
        log_warn("BULK", "device " + abbreviate(targets[i].target_id) +
                             " rejected: " + *problem);
        state->resolve(
            i, failed(cause::TargetInvalid{targets[i].target_id, *problem}));
      } else {
        to_upload.push_back(i);
      }
    }
  }

  for (std::size_t i : to_upload) {
    if (!pool_.submit([this, state, i] { upload_one(state, i); })) {
      boost::lock_guard<boost::mutex> lk(state->m);
      state->resolve(i, failed(cause::Overloaded{"upload workers stopped"}));
    }
  }

  boost::unique_lock<boost::mutex> lk(state->m);
  while (state->unresolved > 0) {
    if (cancelled && cancelled->load(std::memory_order_acquire)) {
      state->abandoned = true;
      log_info("BULK", "run cancelled with " +
                           std::to_string(state->unresolved) +
                           " devices unresolved");
      throw RunCancelled();
    }

    const auto now = std::chrono::steady_clock::now();
    auto wake = now + kPollInterval;
    for (std::size_t i = 0; i < state->slots.size(); ++i) {
      const auto &slot = state->slots[i];
      if (slot.outcome || !slot.started)
        continue;
      const auto deadline = *slot.started + cfg_.per_target_timeout;
      if (deadline <= now) {
        log_warn("BULK", "device " + abbreviate(state->targets[i].target_id) +
                             ": no upstream reply within " +
                             std::to_string(cfg_.per_target_timeout.count()) +
                             "ms");
        state->resolve(
            i, failed(cause::Upstream{
                   std::nullopt,
                   "upload timed out after " +
                       std::to_string(cfg_.per_target_timeout.count()) +
                       "ms"}));
      } else {
        wake = std::min(wake, deadline);
      }
    }
    if (state->unresolved == 0)
      break;

    const auto wait_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(wake - now)
            .count() +
        1;
    state->cv.wait_for(lk, boost::chrono::milliseconds(wait_ms));
  }

  state->abandoned = true;
  std::map<std::string, TargetOutcome> results;
  for (std::size_t i = 0; i < state->slots.size(); ++i)
    results.emplace(state->targets[i].target_id,
                    std::move(*state->slots[i].outcome));
  lk.unlock();

  BulkReport report(std::move(results));
  const BulkSummary s = report.summary();
  g_bulk_targets_succeeded.fetch_add(s.successful_devices,
                                     std::memory_order_relaxed);
  g_bulk_targets_failed.fetch_add(s.failed_devices, std::memory_order_relaxed);
  log_info("BULK", "completed: " + std::to_string(s.successful_devices) + "/" +
                       std::to_string(s.total_devices) + " devices, " +
                       std::to_string(s.total_data_points) + " data points");
  return report;
}

void BulkUploadOrchestrator::upload_one(const std::shared_ptr<RunState> &state,
                                        std::size_t index) {
  {
    boost::lock_guard<boost::mutex> lk(state->m);
    if (state->abandoned || state->slots[index].outcome)
      return;
    state->slots[index].started = std::chrono::steady_clock::now();
  }
  state->cv.notify_all();

  const UploadTarget &target = state->targets[index];
  UploadResult result;
  try {
    result = upstream_.upload(target.target_id, target.payload);
  } catch (const std::exception &e) {
    result = UpstreamFailure{std::nullopt, e.what()};
  }

  TargetOutcome outcome;
  if (std::holds_alternative<UploadAck>(result)) {
    outcome.status = TargetStatus::Success;
    for (const auto &kv : target.payload)
      outcome.keys_uploaded.push_back(kv.first);
    outcome.data_points = count_samples(target.payload);
  } else {
    const auto &f = std::get<UpstreamFailure>(result);
    outcome = failed(cause::Upstream{f.status_code, f.message});
  }

  {
    boost::lock_guard<boost::mutex> lk(state->m);
    state->resolve(index, std::move(outcome));
  }
  state->cv.notify_all();
}

} // namespace tbproxy
