#include <funcorch/common/http.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/server.hpp>

#include <csignal>

#include <spdlog/spdlog.h>

void signal_handler(int /*unused*/)
{
  funcorch::orchestrator::Server::instance()->shutdown();
}

int main(int argc, char** argv)
{
  auto cfg = funcorch::orchestrator::config::Config::deserialize(argc, argv);
  if (cfg.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing function orchestrator!");

  // Used to call functions registered by URL.
  funcorch::common::http::HTTPClientFactory::initialize(1);

  // Catch SIGINT
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);

  funcorch::orchestrator::Server::configure(cfg);
  funcorch::orchestrator::Server::instance()->run();

  funcorch::orchestrator::Server::instance()->wait();

  funcorch::common::http::HTTPClientFactory::shutdown();

  spdlog::info("Orchestrator is closing down");
  return 0;
}
