#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

#include "gambit/about.hpp"
#include "gambit/config.hpp"
#include "gambit/engine.hpp"
#include "gambit/engine_pool.hpp"
#include "gambit/http_server.hpp"
#include "gambit/log.hpp"
#include "gambit/orchestrator.hpp"
#include "gambit/session_store.hpp"

using namespace gambit;

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "gambit";
  const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  Config config;
  try {
    config = parse_args(args);
  } catch (const std::runtime_error& ex) {
    std::cerr << "error: " << ex.what() << "\n\n" << usage(program);
    return 1;
  }

  if (config.show_help) {
    print_about(std::cout);
    std::cout << usage(program);
    return 0;
  }

  log::set_level(config.log_level);
  log::info("main", about_message());

  const auto engine_path =
      config.engine_path.has_value() ? config.engine_path : find_engine_binary(engine_candidates());
  if (!engine_path.has_value()) {
    log::error("main", "no UCI engine found; pass --engine PATH");
    return 1;
  }

  // Signals are taken synchronously by a dedicated thread; every other thread
  // inherits the blocked mask.
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

  log::info("main", "engine " + *engine_path + ", pool of " + std::to_string(config.pool_size) +
                        ", depth " + std::to_string(config.depth) + ", session ttl " +
                        std::to_string(config.session_ttl.count()) + "s");

  const UciEngineOptions engine_options{
      .command = {*engine_path},
      .handshake_timeout = config.handshake_timeout,
      .options = {{"Threads", std::to_string(config.engine_threads)}},
  };

  EnginePool pool([engine_options] { return std::make_unique<UciEngine>(engine_options); },
                  EnginePoolOptions{
                      .size = config.pool_size,
                      .acquire_timeout = config.acquire_timeout,
                      .max_spawn_failures = config.max_spawn_failures,
                  });
  if (pool.degraded()) {
    log::error("main", "engine pool degraded at start-up; serving read-only until reset");
  }

  SessionStore sessions(SessionStoreOptions{.ttl = config.session_ttl});
  IdleReaper reaper(sessions, config.reap_interval);

  Orchestrator orchestrator(sessions, pool,
                            OrchestratorOptions{
                                .default_depth = config.depth,
                                .engine_timeout = config.engine_timeout,
                                .busy_policy = config.busy_policy,
                            });

  HttpServer server(orchestrator, pool, sessions, HttpOptions{.workers = config.workers});

  std::atomic_bool signalled{false};
  std::thread signal_thread([&] {
    int sig = 0;
    sigwait(&shutdown_signals, &sig);
    signalled.store(true, std::memory_order_release);
    log::info("main", "received signal " + std::to_string(sig) + ", shutting down");
    server.stop();
  });

  const bool served = server.listen(config.host, config.port);
  if (!served) {
    log::error("main", "could not listen on " + config.host + ":" + std::to_string(config.port));
  }

  if (!signalled.load(std::memory_order_acquire)) {
    pthread_kill(signal_thread.native_handle(), SIGTERM);
  }
  signal_thread.join();

  return served ? 0 : 1;
}
