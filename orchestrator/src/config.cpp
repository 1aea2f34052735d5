#include <funcorch/orchestrator/config.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace funcorch::orchestrator::config {

  void HTTPServer::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
    archive(CEREAL_NVP(port));
    archive(CEREAL_NVP(idle_connection_timeout));
    if (idle_connection_timeout < 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Incorrect idle connection timeout {}", idle_connection_timeout)
      );
    }
  }

  void HTTPServer::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
    port = DEFAULT_PORT;
    idle_connection_timeout = DEFAULT_IDLE_CONNECTION_TIMEOUT;
    // 1 MiB
    max_payload_size = 1024 * 1024;
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(threads));
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Retry::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(max_retry_count));
    if (max_retry_count < 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Incorrect retry count {}", max_retry_count)
      );
    }

    std::string strategy;
    archive(CEREAL_NVP(strategy));
    this->strategy = backoff::deserialize(strategy);

    // Delays are only meaningful when there is a delay.
    if (this->strategy != backoff::Strategy::NONE) {
      archive(CEREAL_NVP(delay_ms));
      archive(CEREAL_NVP(max_delay_ms));
    }
  }

  void Retry::set_defaults()
  {
    max_retry_count = DEFAULT_MAX_RETRY_COUNT;
    strategy = backoff::Strategy::NONE;
    delay_ms = 0;
    max_delay_ms = 0;
  }

  void Heartbeat::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(poll_interval_ms));
    if (poll_interval_ms <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Incorrect heartbeat poll interval {}", poll_interval_ms)
      );
    }
  }

  void Heartbeat::set_defaults()
  {
    poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
  }

  void Storage::load(cereal::JSONInputArchive& archive)
  {
    std::string type;
    archive(CEREAL_NVP(type));
    storage_type = storage::deserialize(type);

    archive(CEREAL_NVP(root));
    archive(CEREAL_NVP(scan_timeout_ms));
  }

  void Storage::set_defaults()
  {
    storage_type = storage::Type::LOCAL;
    root = "storage";
    scan_timeout_ms = DEFAULT_SCAN_TIMEOUT_MS;
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cfg.set_defaults();
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options(
        "funcorch-orchestrator", "Executes the function execution orchestrator."
    );
    options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>())(
        "v,verbose", "Verbose output.", cxxopts::value<bool>()->default_value("false")
    );
    auto parsed_options = options.parse(argc, argv);

    Config cfg;
    cfg.set_defaults();

    if (parsed_options.count("config")) {

      std::string config_file{parsed_options["config"].as<std::string>()};
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        spdlog::error("Could not open config file {}", config_file);
        exit(1);
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    }

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }

    return cfg;
  }

  void Config::set_defaults()
  {
    verbose = false;

    http.set_defaults();
    workers.set_defaults();
    retry.set_defaults();
    heartbeat.set_defaults();
    storage.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(verbose));

    common::util::cereal_load_optional(archive, "http", this->http);
    common::util::cereal_load_optional(archive, "workers", this->workers);
    common::util::cereal_load_optional(archive, "retry", this->retry);
    common::util::cereal_load_optional(archive, "heartbeat", this->heartbeat);
    common::util::cereal_load_optional(archive, "storage", this->storage);
  }

} // namespace funcorch::orchestrator::config
