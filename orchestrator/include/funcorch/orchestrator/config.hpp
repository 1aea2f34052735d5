#ifndef FUNCORCH_ORCHESTRATOR_CONFIG_HPP
#define FUNCORCH_ORCHESTRATOR_CONFIG_HPP

#include <funcorch/orchestrator/backoff.hpp>
#include <funcorch/orchestrator/storage.hpp>

#include <istream>
#include <string>

#include <cereal/archives/json.hpp>

namespace funcorch::orchestrator::config {

  struct HTTPServer {

    static constexpr int DEFAULT_THREADS_NUMBER = 1;
    static constexpr int DEFAULT_PORT = 8080;
    static constexpr int DEFAULT_IDLE_CONNECTION_TIMEOUT = 120;

    HTTPServer()
    {
      set_defaults();
    }

    int port;
    int threads;
    int max_payload_size;
    // Seconds; zero keeps idle connections open.
    int idle_connection_timeout;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Workers {
    static constexpr int DEFAULT_THREADS_NUMBER = 1;

    Workers()
    {
      set_defaults();
    }

    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Retry {

    // Two re-attempts after the initial one.
    static constexpr int DEFAULT_MAX_RETRY_COUNT = 2;

    Retry()
    {
      set_defaults();
    }

    int max_retry_count;
    backoff::Strategy strategy;
    int delay_ms;
    int max_delay_ms;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Heartbeat {

    static constexpr int DEFAULT_POLL_INTERVAL_MS = 30 * 1000;

    Heartbeat()
    {
      set_defaults();
    }

    int poll_interval_ms;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Storage {

    static constexpr int DEFAULT_SCAN_TIMEOUT_MS = 30 * 1000;

    Storage()
    {
      set_defaults();
    }

    storage::Type storage_type;
    std::string root;
    int scan_timeout_ms;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Config {

    HTTPServer http;
    Workers workers;
    Retry retry;
    Heartbeat heartbeat;
    Storage storage;

    bool verbose;

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
  };

} // namespace funcorch::orchestrator::config

#endif
