// src/http_server.cpp
#include "tbproxy/http_server.hpp"
#include "tbproxy/logging.hpp"
#include <algorithm>
#include <boost/beast.hpp>
#include <boost/thread/lock_guard.hpp>
#include <cctype>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace tbproxy {

struct HttpServer::Session
    : public std::enable_shared_from_this<HttpServer::Session> {
  tcp::socket socket;
  HttpServer &server;
  std::shared_ptr<SessionRegistry> registry;

  // Raised when the client goes away before its answer is written, or when
  // the server stops. Read by the bulk orchestrator on a worker thread.
  std::atomic<bool> cancelled{false};
  // Both only touched on the strand.
  bool responding = false;
  bool peer_gone = false;
  char watch_byte = 0;

  beast::flat_buffer buffer;
  http::request_parser<http::string_body> parser;
  http::response<http::string_body> res;
  unsigned version = 11;

  // strand from the socket's executor, any_io_executor flavour
  net::strand<net::any_io_executor> strand;

  Session(tcp::socket s, HttpServer &srv)
      : socket(std::move(s)), server(srv), registry(srv.sessions_),
        strand(net::make_strand(socket.get_executor())) {
    parser.body_limit(server.cfg_.max_body_bytes);
    boost::lock_guard<boost::mutex> lk(registry->m);
    registry->flags.insert(&cancelled);
    if (registry->stopped)
      cancelled.store(true, std::memory_order_release);
  }

  ~Session() {
    boost::lock_guard<boost::mutex> lk(registry->m);
    registry->flags.erase(&cancelled);
  }

  void run() { read_request(); }

  void read_request() {
    auto self = shared_from_this();
    http::async_read(
        socket, buffer, parser,
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          if (ec == http::error::body_limit) {
            self->write_response(self->server.router_.error_response(
                cause::SchemaViolation{"request body too large"}));
            return;
          }
          if (ec) {
            log_dbg("HTTP", "read failed: " + ec.message());
            return;
          }
          self->handle_request();
        }));
  }

  ApiRequest to_api_request() {
    auto &req = parser.get();
    version = req.version();

    ApiRequest in;
    in.method = std::string(req.method_string());
    const std::string target(req.target());
    in.path = target.substr(0, target.find('?'));
    for (const auto &field : req) {
      std::string name(field.name_string());
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      in.headers[name] = std::string(field.value());
    }
    in.body = std::move(req.body());

    beast::error_code ec;
    const auto peer = socket.remote_endpoint(ec);
    if (!ec)
      in.remote_address = peer.address().to_string();
    return in;
  }

  void handle_request() {
    auto reply = std::make_shared<ReplyHandle>();
    reply->respond = [self = shared_from_this()](ApiResponse r) {
      net::dispatch(self->strand, [self, r = std::move(r)]() mutable {
        self->write_response(std::move(r));
      });
    };

    // The job keeps the session, and with it the flag, alive through reply.
    Router &router = server.router_;
    const std::atomic<bool> *flag = &cancelled;
    const bool queued = server.workers_.try_submit(
        [&router, flag, in = to_api_request(), reply] {
          reply->respond(router.handle(in, flag));
        });

    if (!queued) {
      log_warn("HTTP", "request queue full, shedding request");
      write_response(
          router.error_response(cause::Overloaded{"request queue full"}));
      return;
    }
    watch_peer();
  }

  // While the job is pending, a read that ends in EOF or an error means the
  // client is gone. Stray bytes after the request are ignored.
  void watch_peer() {
    auto self = shared_from_this();
    socket.async_read_some(
        net::buffer(&watch_byte, 1),
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          if (self->responding)
            return;
          if (!ec) {
            self->watch_peer();
            return;
          }
          self->peer_gone = true;
          self->cancelled.store(true, std::memory_order_release);
          log_dbg("HTTP", "client went away before the reply: " + ec.message());
        }));
  }

  void write_response(ApiResponse r) {
    if (peer_gone) {
      log_dbg("HTTP", "dropping reply for a closed connection");
      return;
    }
    responding = true;

    res.version(version);
    res.keep_alive(false);
    res.result(static_cast<http::status>(r.status));
    res.set(http::field::content_type, "application/json");
    for (const auto &h : r.headers)
      res.set(h.first, h.second);
    res.body() = std::move(r.body);
    res.prepare_payload();

    auto self = shared_from_this();
    http::async_write(
        socket, res,
        net::bind_executor(strand, [self](beast::error_code wec, std::size_t) {
          if (wec)
            log_dbg("HTTP", "write failed: " + wec.message());
          beast::error_code ec;
          self->socket.shutdown(tcp::socket::shutdown_send, ec);
          // ends a pending watch_peer read
          self->socket.cancel(ec);
        }));
  }
};

HttpServer::HttpServer(net::io_context &ioc, const Config &cfg, Router &router,
                       WorkerPool &workers)
    : ioc_(ioc), cfg_(cfg), router_(router), workers_(workers), acceptor_(ioc),
      socket_(ioc), sessions_(std::make_shared<SessionRegistry>()),
      work_guard_(net::make_work_guard(ioc_)) {}

void HttpServer::run() {
  if (running_.exchange(true))
    return;

  tcp::endpoint ep{net::ip::make_address(cfg_.host), cfg_.port};
  acceptor_.open(ep.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen(net::socket_base::max_listen_connections);
  log_info("HTTP", "listening on " + cfg_.host + ":" + std::to_string(port()));

  do_accept();
}

void HttpServer::stop() {
  {
    boost::lock_guard<boost::mutex> lk(sessions_->m);
    sessions_->stopped = true;
    for (auto *flag : sessions_->flags)
      flag->store(true, std::memory_order_release);
  }
  if (!running_.exchange(false))
    return;
  work_guard_.reset(); // let the io_context run dry
  beast::error_code ec;
  acceptor_.close(ec);
  if (ec)
    log_warn("HTTP", "closing acceptor: " + ec.message());
}

unsigned short HttpServer::port() const {
  beast::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? cfg_.port : ep.port();
}

void HttpServer::do_accept() {
  acceptor_.async_accept(socket_, [this](beast::error_code ec) {
    if (!ec) {
      std::make_shared<Session>(std::move(socket_), *this)->run();
    } else if (running_) {
      log_dbg("HTTP", "accept failed: " + ec.message());
    }
    if (running_)
      do_accept();
  });
}

} // namespace tbproxy
