#include "tbproxy/bulk_upload.hpp"
#include "tbproxy/config.hpp"
#include "tbproxy/error_normalizer.hpp"
#include "tbproxy/http_server.hpp"
#include "tbproxy/logging.hpp"
#include "tbproxy/rate_limiter.hpp"
#include "tbproxy/router.hpp"
#include "tbproxy/thingsboard_client.hpp"
#include "tbproxy/worker_pool.hpp"

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

static void term_handler() {
  try {
    throw; // rethrow whatever brought us here
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path = "server.json";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      cfg_path = argv[++i];
  }

  tbproxy::Config cfg;
  try {
    cfg = tbproxy::load_config(cfg_path);
    tbproxy::set_log_level(tbproxy::parse_log_level(cfg.log_level));
  } catch (const std::exception &e) {
    tbproxy::log_err("MAIN", std::string("invalid configuration: ") + e.what());
    return 1;
  }

  if (cfg.debug)
    tbproxy::log_warn("MAIN", "debug mode: error bodies carry internal detail");
  if (cfg.api_key.empty())
    tbproxy::log_warn("MAIN", "no api_key configured, bulk upload is open");

  boost::asio::io_context ioc;

  tbproxy::ErrorNormalizer normalizer(cfg.debug);
  tbproxy::RateLimiter limiter(tbproxy::rate_limiter_config(cfg));
  tbproxy::ThingsBoardClient thingsboard(tbproxy::thingsboard_config(cfg));
  tbproxy::BulkUploadOrchestrator bulk(thingsboard, normalizer,
                                       tbproxy::bulk_upload_config(cfg));
  tbproxy::WorkerPool requests("request", cfg.request_workers,
                               cfg.queue_capacity);
  tbproxy::Router router(cfg, limiter, bulk, normalizer);
  tbproxy::HttpServer server(ioc, cfg, router, requests);

  try {
    requests.start();
    server.run();
  } catch (const std::exception &e) {
    tbproxy::log_err("MAIN", std::string("startup error: ") + e.what());
    requests.stop();
    return 1;
  }

  const std::size_t n_threads = std::max<std::size_t>(1, cfg.http_threads);

  std::vector<std::unique_ptr<boost::thread>> threads;
  threads.reserve(n_threads - 1);
  for (std::size_t i = 0; i + 1 < n_threads; ++i)
    threads.emplace_back(std::make_unique<boost::thread>([&ioc] { ioc.run(); }));

  tbproxy::log_info("MAIN", cfg.service_name + " " + cfg.version + " up, " +
                                std::to_string(n_threads) + " io threads, " +
                                std::to_string(cfg.request_workers) +
                                " request workers");

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int sig) {
    if (ec)
      return;
    tbproxy::log_info("MAIN", "signal " + std::to_string(sig) + ", stopping");
    server.stop();
    ioc.stop(); // wake every thread out of run()
  });

  // The main thread runs the io_context too.
  ioc.run();

  for (auto &t : threads)
    t->join();

  // server.stop() raised every connection's cancel flag, so in-flight bulk
  // runs bail out instead of holding the request workers.
  requests.stop();
  bulk.stop();
  tbproxy::log_info("MAIN", "stopped");
  return 0;
}
