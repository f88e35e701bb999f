// File: src/main.cpp
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>

#include "hitl/Coordinator.hpp"
#include "hitl/server/ApprovalServer.hpp"

#include "hitl/util/Config.hpp"
#include "hitl/util/Logger.hpp"
#include "hitl/util/Metrics.hpp"
#include "hitl/rt/ThreadPool.hpp"
#include "hitl/runtime/ShutdownCoordinator.hpp"

using hitl::util::LogLevel;
using hitl::util::logger;

namespace {

// Demo waiter: asks owner "demo" for permission to delete a file, the way an
// agent's tool wrapper would, and logs what it got back.
void scheduleDemoRequest(boost::asio::steady_timer& timer,
                         hitl::rt::ThreadPool& pool,
                         hitl::Coordinator& coord,
                         const hitl::CancellationToken& token,
                         std::chrono::seconds every) {
  timer.expires_after(every);
  timer.async_wait([&timer, &pool, &coord, token, every](boost::system::error_code ec) {
    if (ec) return;   // cancelled on shutdown
    const bool queued = pool.post([&coord, token] {
      hitl::ToolRequest req;
      req.name        = "delete_file";
      req.description = "Delete a file from the filesystem";
      req.argsJson    = R"({"path":"/tmp/demo.txt"})";
      req.metadata["source"] = "demo-agent";
      try {
        const auto d = coord.requestDecision("demo", std::move(req), token);
        logger().log(LogLevel::Info, "demo.outcome", { {"decision", hitl::toString(d)} });
      } catch (const hitl::CancelledError& ex) {
        logger().log(LogLevel::Info, "demo.cancelled", { {"id", ex.requestId()} });
      } catch (const hitl::ApprovalError& ex) {
        logger().log(LogLevel::Error, "demo.failed", { {"error", ex.what()} });
      }
    });
    if (!queued) return;   // pool is shutting down
    scheduleDemoRequest(timer, pool, coord, token, every);
  });
}

} // namespace

int main(int argc, char* argv[]) {
  // ---------------------------
  // 1) Config
  //    argv[1] = httpPort (optional)
  //    argv[2] = configFilePath (optional)
  // ---------------------------
  hitl::util::Config cfg;

  if (argc > 2) {
    if (!cfg.loadFromFile(argv[2])) {
      std::cerr << "[config] warning: failed to load file: " << argv[2] << "\n";
    }
  }
  if (argc > 1 && !cfg.set("httpPort", argv[1])) {
    std::cerr << "Invalid port '" << argv[1] << "', using " << cfg.httpPort << "\n";
  }

  // ---------------------------
  // 2) Logger / metrics
  // ---------------------------
  logger().setLevel(hitl::util::parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!logger().setFile(cfg.logFile)) {
    std::cerr << "[log] cannot open '" << cfg.logFile << "', logging to stdout\n";
  }
  if (cfg.metricsIntervalSec > 0) {
    hitl::util::MetricRegistry::instance().startReporter(static_cast<unsigned>(cfg.metricsIntervalSec));
  }

  logger().log(LogLevel::Info, "boot",
               { {"httpAddress", cfg.httpAddress},
                 {"httpPort", std::to_string(cfg.httpPort)},
                 {"approvalTimeoutSec", std::to_string(cfg.approvalTimeoutSec)},
                 {"autoApproveOnTimeout", cfg.autoApproveOnTimeout ? "true" : "false"} });

  // ---------------------------
  // 3) Core + runtime
  // ---------------------------
  hitl::Coordinator coordinator(hitl::CoordinatorOptions::fromConfig(cfg));
  hitl::rt::ThreadPool pool(static_cast<unsigned>(cfg.workerThreads));
  hitl::CancellationSource agentCancel;

  boost::asio::io_context ioc(cfg.ioThreads);

  std::unique_ptr<hitl::server::ApprovalServer> http;
  try {
    http = std::make_unique<hitl::server::ApprovalServer>(ioc, coordinator, cfg.httpAddress, cfg.httpPort);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "http.listen_failed", { {"error", ex.what()} });
    return EXIT_FAILURE;
  }
  http->run();

  boost::asio::steady_timer demoTimer(ioc);
  if (cfg.demoAgent) {
    scheduleDemoRequest(demoTimer, pool, coordinator, agentCancel.token(),
                        std::chrono::seconds(cfg.demoIntervalSec));
  }

  // ---------------------------
  // 4) Shutdown sequencing
  // ---------------------------
  hitl::rt::ShutdownCoordinator shutdown;
  shutdown.registerStep("http-stop-accept",    5, [&http]{ http->stopAccept(); });
  shutdown.registerStep("demo-timer-cancel",  10, [&demoTimer]{ demoTimer.cancel(); });
  shutdown.registerStep("agent-cancel",       20, [&agentCancel]{ agentCancel.requestCancel(); });
  shutdown.registerStep("coordinator-stop",   30, [&coordinator]{ coordinator.shutdown(); });
  shutdown.registerStep("http-close",         40, [&http]{ http->closeAll(); });
  shutdown.registerStep("pool-drain",         80, [&pool]{ pool.drain(); });
  shutdown.registerStep("asio-stop",          90, [&ioc]{ ioc.stop(); });
  shutdown.registerStep("metrics-stop",       95, []{ hitl::util::MetricRegistry::instance().stopReporter(); });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&shutdown](boost::system::error_code ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", { {"sig", std::to_string(sig)} });
    // Waiters are cancelled before the pool drains, so this does not stall
    // the io thread for long.
    shutdown.stop();
  });

  logger().log(LogLevel::Info, "listening", { {"httpPort", std::to_string(http->port())} });

  // ---------------------------
  // 5) Run
  // ---------------------------
  std::vector<std::thread> io;
  for (int i = 1; i < cfg.ioThreads; ++i) {
    io.emplace_back([&ioc]{ ioc.run(); });
  }
  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, std::string("io_context exception: ") + ex.what(), {});
  }
  for (auto& t : io) t.join();

  // Ensure shutdown steps ran even on natural exit
  shutdown.stop();
  pool.shutdown();

  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
