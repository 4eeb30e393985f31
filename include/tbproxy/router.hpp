#pragma once
#include "bulk_upload.hpp"
#include "error_normalizer.hpp"
#include "rate_limiter.hpp"
#include "request_context.hpp"
#include "types.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace tbproxy {

// Key a caller is rate-limited by: first X-Forwarded-For hop, then
// X-Real-IP (both only when trusted), then the socket peer, then "unknown".
std::string extract_identity(const ApiRequest &req, bool trust_forwarded);

// Request pipeline: rate limit -> API key -> route -> normalized errors.
//
//   GET  /                          service name and version
//   GET  /api/v1/health             liveness and counters
//   POST /api/v1/tb/telemetry/bulk  bulk telemetry upload
//
// The first two skip rate limiting and authentication.
class Router {
public:
  Router(const Config &cfg, RateLimiter &limiter, BulkUploadOrchestrator &bulk,
         const ErrorNormalizer &normalizer);

  // Never throws; every failure becomes a normalized error response.
  ApiResponse handle(const ApiRequest &req,
                     const std::atomic<bool> *cancelled = nullptr);

  // Error body plus security headers, for failures outside handle() too.
  ApiResponse error_response(const ErrorCause &cause) const;

private:
  ApiResponse dispatch(const ApiRequest &req, const std::atomic<bool> *cancelled);
  ApiResponse route(const ApiRequest &req, const std::string &identity,
                    const std::atomic<bool> *cancelled);
  ApiResponse handle_root() const;
  ApiResponse handle_health() const;
  ApiResponse handle_bulk(const ApiRequest &req,
                          const std::atomic<bool> *cancelled);

  // nullopt when the key is valid or no key is configured
  std::optional<ErrorCause> check_api_key(const ApiRequest &req) const;

  ApiResponse json_response(int status, const nlohmann::json &body) const;
  void add_rate_headers(ApiResponse &res, const RateDecision &d,
                        RateLimiter::time_point now) const;
  void add_security_headers(ApiResponse &res) const;

  const Config cfg_;
  RateLimiter &limiter_;
  BulkUploadOrchestrator &bulk_;
  const ErrorNormalizer &normalizer_;
};

} // namespace tbproxy
