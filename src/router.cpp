#include "tbproxy/router.hpp"
#include "tbproxy/bulk_request.hpp"
#include "tbproxy/logging.hpp"
#include "tbproxy/metrics_export.hpp"
#include "tbproxy/time_utils.hpp"

#include <chrono>
#include <exception>

using json = nlohmann::json;

namespace tbproxy {

namespace {

constexpr const char *kRootPath = "/";
constexpr const char *kHealthPath = "/api/v1/health";
constexpr const char *kBulkPath = "/api/v1/tb/telemetry/bulk";

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos)
    return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

// Length still leaks; the contents do not.
bool keys_equal(const std::string &a, const std::string &b) {
  if (a.size() != b.size())
    return false;
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i)
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  return diff == 0;
}

} // namespace

std::string extract_identity(const ApiRequest &req, bool trust_forwarded) {
  if (trust_forwarded) {
    if (const auto *fwd = req.header("x-forwarded-for")) {
      std::string first = trim(fwd->substr(0, fwd->find(',')));
      if (!first.empty())
        return first;
    }
    if (const auto *real = req.header("x-real-ip")) {
      std::string ip = trim(*real);
      if (!ip.empty())
        return ip;
    }
  }
  if (!req.remote_address.empty())
    return req.remote_address;
  return "unknown";
}

Router::Router(const Config &cfg, RateLimiter &limiter,
               BulkUploadOrchestrator &bulk, const ErrorNormalizer &normalizer)
    : cfg_(cfg), limiter_(limiter), bulk_(bulk), normalizer_(normalizer) {}

ApiResponse Router::handle(const ApiRequest &req,
                           const std::atomic<bool> *cancelled) {
  g_requests_total.fetch_add(1, std::memory_order_relaxed);
  try {
    return dispatch(req, cancelled);
  } catch (const ApiError &e) {
    log_warn("HTTP", req.method + " " + req.path + " rejected: " + e.what());
    return error_response(e.cause());
  } catch (const std::exception &e) {
    log_err("HTTP", req.method + " " + req.path + " failed: " + e.what());
    return error_response(cause::Internal{e.what()});
  }
}

ApiResponse Router::dispatch(const ApiRequest &req,
                             const std::atomic<bool> *cancelled) {
  const std::string identity =
      extract_identity(req, cfg_.trust_forwarded_headers);

  // Health checks stay reachable for load balancers no matter how busy a client is.
  if (req.path == kRootPath || req.path == kHealthPath)
    return route(req, identity, cancelled);

  const RateLimiter::time_point now = limiter_.now();
  const RateDecision decision = limiter_.admit(identity, now);

  if (!decision.allowed) {
    g_requests_rate_limited.fetch_add(1, std::memory_order_relaxed);
    const std::int64_t retry_after = decision.retry_after(now);
    log_warn("RATE", "limit exceeded for " + identity + ": " +
                         std::to_string(limiter_.limit()) + " requests in " +
                         std::to_string(limiter_.window_seconds()) +
                         "s window");

    ApiResponse res = error_response(cause::RateLimited{
        limiter_.limit(), limiter_.window_seconds(), retry_after});
    res.set_header("Retry-After", std::to_string(retry_after));
    add_rate_headers(res, decision, now);
    return res;
  }

  ApiResponse res = route(req, identity, cancelled);
  add_rate_headers(res, decision, now);
  return res;
}

ApiResponse Router::route(const ApiRequest &req, const std::string &identity,
                          const std::atomic<bool> *cancelled) {
  if (req.method == "GET" && req.path == kRootPath)
    return handle_root();
  if (req.method == "GET" && req.path == kHealthPath)
    return handle_health();

  if (req.method == "POST" && req.path == kBulkPath) {
    if (auto failure = check_api_key(req)) {
      g_auth_failures.fetch_add(1, std::memory_order_relaxed);
      log_warn("AUTH", "rejected " + req.method + " " + req.path + " from " +
                           identity);
      ApiResponse res = error_response(*failure);
      res.set_header("WWW-Authenticate", "ApiKey");
      return res;
    }
    return handle_bulk(req, cancelled);
  }

  return error_response(cause::RouteNotFound{req.method, req.path});
}

ApiResponse Router::handle_root() const {
  return json_response(200, {{"service", cfg_.service_name},
                             {"version", cfg_.version}});
}

ApiResponse Router::handle_health() const {
  json counters = counters_snapshot();
  counters["upload_queue_depth"] = bulk_.queued();
  return json_response(200, {{"status", "success"},
                             {"timestamp", unix_millis_now()},
                             {"service", cfg_.service_name},
                             {"version", cfg_.version},
                             {"counters", std::move(counters)}});
}

ApiResponse Router::handle_bulk(const ApiRequest &req,
                                const std::atomic<bool> *cancelled) {
  const std::vector<UploadTarget> targets = parse_bulk_request(req.body);
  try {
    const BulkReport report = bulk_.run(targets, cancelled);
    return json_response(200, report.to_json());
  } catch (const RunCancelled &e) {
    log_info("HTTP", std::string("bulk upload abandoned: ") + e.what());
    return error_response(cause::Overloaded{"request cancelled"});
  }
}

std::optional<ErrorCause> Router::check_api_key(const ApiRequest &req) const {
  if (cfg_.api_key.empty())
    return std::nullopt;

  const std::string *key = req.header("x-api-key");
  if (!key || key->empty())
    return ErrorCause{cause::MissingApiKey{}};
  if (!keys_equal(*key, cfg_.api_key))
    return ErrorCause{cause::InvalidApiKey{}};
  return std::nullopt;
}

ApiResponse Router::error_response(const ErrorCause &cause) const {
  const NormalizedError e = normalizer_.normalize(cause);
  return json_response(e.status, e.to_json());
}

ApiResponse Router::json_response(int status, const json &body) const {
  ApiResponse res;
  res.status = status;
  // Paths and device ids are echoed back; invalid UTF-8 must not turn a
  // 404 into a 500.
  res.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  add_security_headers(res);
  return res;
}

void Router::add_rate_headers(ApiResponse &res, const RateDecision &d,
                              RateLimiter::time_point now) const {
  res.set_header("X-RateLimit-Limit", std::to_string(limiter_.limit()));
  res.set_header("X-RateLimit-Remaining", std::to_string(d.remaining));
  res.set_header("X-RateLimit-Reset",
                 std::to_string(unix_seconds_at(
                     d.reset_at, now, std::chrono::system_clock::now())));
}

void Router::add_security_headers(ApiResponse &res) const {
  res.set_header("X-Content-Type-Options", "nosniff");
  res.set_header("X-Frame-Options", "DENY");
  res.set_header("X-XSS-Protection", "1; mode=block");
  res.set_header("Referrer-Policy", "strict-origin-when-cross-origin");
  if (!cfg_.debug)
    res.set_header("Strict-Transport-Security",
                   "max-age=31536000; includeSubDomains");
}

} // namespace tbproxy
