#include "tbproxy/thingsboard_client.hpp"
#include "tbproxy/logging.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/beast.hpp>
#include <cctype>
#include <cstdio>
#include <optional>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace tbproxy {

namespace {

constexpr auto kTokenRefreshGuard = std::chrono::seconds(30);

class LoginFailed : public std::runtime_error {
public:
  LoginFailed(std::optional<int> status, const std::string &what)
      : std::runtime_error(what), status_(status) {}

  std::optional<int> status() const noexcept { return status_; }

private:
  std::optional<int> status_;
};

// Runs queued handlers until the io_context has no more work.
void run_io(net::io_context &ioc) {
  ioc.restart();
  ioc.run();
}

void throw_if(const beast::error_code &ec) {
  if (ec)
    throw beast::system_error(ec);
}

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

ThingsBoardClient::ThingsBoardClient(ThingsBoardConfig cfg)
    : cfg_(std::move(cfg)) {
  log_warn("TB", "upstream " + cfg_.host + ":" + std::to_string(cfg_.port) +
                     " is plain HTTP, traffic is not encrypted");
  if (cfg_.username.empty())
    log_warn("TB", "no upstream username configured, uploads are sent "
                   "without X-Authorization");
}

std::string ThingsBoardClient::timeseries_path(const std::string &device_id) {
  std::string encoded;
  encoded.reserve(device_id.size());
  for (unsigned char c : device_id) {
    if (is_unreserved(c)) {
      encoded.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      encoded.append(buf);
    }
  }
  return "/api/plugins/telemetry/DEVICE/" + encoded + "/timeseries/any";
}

json ThingsBoardClient::timeseries_body(const TelemetryPayload &payload) {
  json body = json::object();
  for (const auto &[key, samples] : payload) {
    json series = json::array();
    for (const auto &s : samples)
      series.push_back({{"ts", s.ts}, {"value", s.value}});
    body[key] = std::move(series);
  }
  return body;
}

UploadResult ThingsBoardClient::upload(const std::string &target_id,
                                       const TelemetryPayload &payload) {
  const Deadline deadline = std::chrono::steady_clock::now() + cfg_.timeout;
  const std::string path = timeseries_path(target_id);
  const std::string body = timeseries_body(payload).dump();

  try {
    HttpReply reply;
    for (int attempt = 0; attempt < 2; ++attempt) {
      const std::string token = ensure_token(deadline);
      reply = post_json(path, body, token, deadline);
      if (reply.status != 401 || token.empty())
        break;
      log_dbg("TB", "token rejected, logging in again");
      drop_token(token);
    }

    if (reply.status >= 200 && reply.status < 300) {
      UploadAck ack;
      for (const auto &kv : payload)
        ack.accepted_keys.push_back(kv.first);
      ack.accepted_count = count_samples(payload);
      return ack;
    }

    log_warn("TB", "device " + target_id + ": upload rejected with HTTP " +
                       std::to_string(reply.status));
    return UpstreamFailure{reply.status, "upstream returned HTTP " +
                                             std::to_string(reply.status)};
  } catch (const LoginFailed &e) {
    log_warn("TB", e.what());
    return UpstreamFailure{e.status(), e.what()};
  } catch (const beast::system_error &e) {
    const bool timed_out = e.code() == beast::error::timeout;
    std::string msg = timed_out
                          ? std::string("upstream request timed out")
                          : "upstream connection error: " + e.code().message();
    log_warn("TB", "device " + target_id + ": " + msg);
    return UpstreamFailure{std::nullopt, std::move(msg)};
  }
}

std::string ThingsBoardClient::ensure_token(Deadline deadline) {
  if (cfg_.username.empty())
    return {};

  {
    boost::lock_guard<boost::mutex> lk(token_m_);
    if (!token_.empty() && std::chrono::steady_clock::now() < token_expires_)
      return token_;
  }

  boost::lock_guard<boost::mutex> login_lk(login_m_);
  {
    // another worker may have logged in while we waited
    boost::lock_guard<boost::mutex> lk(token_m_);
    if (!token_.empty() && std::chrono::steady_clock::now() < token_expires_)
      return token_;
  }

  std::string fresh = login(deadline);

  boost::lock_guard<boost::mutex> lk(token_m_);
  token_ = fresh;
  token_expires_ =
      std::chrono::steady_clock::now() + cfg_.token_ttl - kTokenRefreshGuard;
  return token_;
}

std::string ThingsBoardClient::login(Deadline deadline) const {
  const json creds = {{"username", cfg_.username},
                      {"password", cfg_.password}};
  const HttpReply reply =
      post_json("/api/auth/login", creds.dump(), std::string(), deadline);

  if (reply.status < 200 || reply.status >= 300)
    throw LoginFailed(reply.status, "upstream login failed with HTTP " +
                                        std::to_string(reply.status));

  std::string token;
  try {
    token = json::parse(reply.body).at("token").get<std::string>();
  } catch (const json::exception &e) {
    throw LoginFailed(std::nullopt,
                      std::string("upstream login reply unusable: ") + e.what());
  }
  log_info("TB", "authenticated against ThingsBoard as " + cfg_.username);
  return token;
}

void ThingsBoardClient::drop_token(const std::string &token) {
  boost::lock_guard<boost::mutex> lk(token_m_);
  if (token_ == token)
    token_.clear();
}

ThingsBoardClient::HttpReply
ThingsBoardClient::post_json(const std::string &path, const std::string &body,
                             const std::string &token,
                             Deadline deadline) const {
  net::io_context ioc;
  beast::error_code ec;

  // Resolve, bounded by the same deadline as the exchange itself.
  tcp::resolver resolver(ioc);
  tcp::resolver::results_type endpoints;
  net::steady_timer guard(ioc);
  bool resolved = false;
  guard.expires_at(deadline);
  guard.async_wait([&](const beast::error_code &e) {
    if (!e && !resolved)
      resolver.cancel();
  });
  resolver.async_resolve(
      cfg_.host, std::to_string(cfg_.port),
      [&](const beast::error_code &e, tcp::resolver::results_type r) {
        resolved = true;
        ec = e;
        endpoints = std::move(r);
        guard.cancel();
      });
  run_io(ioc);
  if (ec == net::error::operation_aborted)
    ec = beast::error::timeout;
  throw_if(ec);

  beast::tcp_stream stream(ioc);
  stream.expires_at(deadline);

  stream.async_connect(endpoints,
                       [&](const beast::error_code &e, const tcp::endpoint &) {
                         ec = e;
                       });
  run_io(ioc);
  throw_if(ec);

  http::request<http::string_body> req{http::verb::post, path, 11};
  req.set(http::field::host, cfg_.host);
  req.set(http::field::content_type, "application/json");
  req.set(http::field::accept, "application/json");
  if (!token.empty())
    req.set("X-Authorization", "Bearer " + token);
  req.body() = body;
  req.prepare_payload();

  http::async_write(stream, req,
                    [&](const beast::error_code &e, std::size_t) { ec = e; });
  run_io(ioc);
  throw_if(ec);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::async_read(stream, buffer, res,
                   [&](const beast::error_code &e, std::size_t) { ec = e; });
  run_io(ioc);
  throw_if(ec);

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  HttpReply reply;
  reply.status = static_cast<int>(res.result_int());
  reply.body = std::move(res.body());
  return reply;
}

} // namespace tbproxy
