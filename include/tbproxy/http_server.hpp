// include/tbproxy/http_server.hpp
#pragma once
#include "router.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/thread/mutex.hpp>
#include <memory>
#include <unordered_set>

namespace tbproxy {

// Accepts connections and parses requests on the io_context, hands each
// request to the request worker pool, and writes the router's answer back on
// the connection's strand. One request per connection.
class HttpServer {
public:
  HttpServer(boost::asio::io_context &ioc, const Config &cfg, Router &router,
             WorkerPool &workers);

  // Throws boost::system::system_error when the endpoint cannot be bound.
  void run();
  // Stops accepting and raises the cancellation flag of every open
  // connection, so in-flight bulk uploads give up.
  void stop();

  // Bound port; differs from the configured one when that was 0.
  unsigned short port() const;

private:
  struct Session;
  // Cancellation flags of the open connections. Shared with the sessions so
  // one that outlives the server never touches freed memory.
  struct SessionRegistry {
    boost::mutex m;
    std::unordered_set<std::atomic<bool> *> flags;
    bool stopped = false;
  };
  void do_accept();

  boost::asio::io_context &ioc_;
  const Config cfg_;
  Router &router_;
  WorkerPool &workers_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::socket socket_;
  std::atomic<bool> running_{false};
  std::shared_ptr<SessionRegistry> sessions_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
};

} // namespace tbproxy
