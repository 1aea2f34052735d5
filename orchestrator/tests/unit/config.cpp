#include <funcorch/common/exceptions.hpp>
#include <funcorch/orchestrator/backoff.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/storage.hpp>

#include <sstream>

#include <gtest/gtest.h>

using namespace funcorch::orchestrator::config;
using funcorch::orchestrator::backoff::Strategy;

TEST(Config, BasicConfig)
{
  std::string config = R"(
    {
      "verbose": true
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.verbose, true);

  EXPECT_EQ(cfg.http.port, HTTPServer::DEFAULT_PORT);
  EXPECT_EQ(cfg.http.threads, HTTPServer::DEFAULT_THREADS_NUMBER);
  EXPECT_EQ(cfg.http.idle_connection_timeout, HTTPServer::DEFAULT_IDLE_CONNECTION_TIMEOUT);

  EXPECT_EQ(cfg.workers.threads, Workers::DEFAULT_THREADS_NUMBER);

  EXPECT_EQ(cfg.retry.max_retry_count, Retry::DEFAULT_MAX_RETRY_COUNT);
  EXPECT_EQ(cfg.retry.strategy, Strategy::NONE);

  EXPECT_EQ(cfg.heartbeat.poll_interval_ms, Heartbeat::DEFAULT_POLL_INTERVAL_MS);

  EXPECT_EQ(cfg.storage.storage_type, funcorch::orchestrator::storage::Type::LOCAL);
  EXPECT_EQ(cfg.storage.scan_timeout_ms, Storage::DEFAULT_SCAN_TIMEOUT_MS);
}

TEST(Config, MissingVerbose)
{
  std::stringstream stream{"{}"};
  EXPECT_ANY_THROW(Config::deserialize(stream));
}

TEST(Config, HTTPConfig)
{
  std::string config = R"(
    {
      "verbose": false,
      "http": {
        "threads": 2,
        "port": 1000,
        "idle_connection_timeout": 30
      }
    }
  )";

  std::stringstream stream{config};
  Config cfg = Config::deserialize(stream);

  EXPECT_EQ(cfg.verbose, false);
  EXPECT_EQ(cfg.http.port, 1000);
  EXPECT_EQ(cfg.http.threads, 2);
  EXPECT_EQ(cfg.http.idle_connection_timeout, 30);
}

TEST(Config, HTTPConfigIdleTimeout)
{
  {
    std::string config = R"(
      {
        "verbose": false,
        "http": {
          "threads": 2,
          "port": 1000,
          "idle_connection_timeout": -1
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "verbose": false,
        "http": {
          "threads": 2,
          "port": 1000,
          "idle_connection_timeout": 0
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);
    EXPECT_EQ(cfg.http.idle_connection_timeout, 0);
  }
}

TEST(Config, WorkersConfig)
{
  {
    std::string config = R"(
      {
        "verbose": true,
        "workers": {
          "threads": 4
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);

    EXPECT_EQ(cfg.workers.threads, 4);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "workers": {
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }
}

TEST(Config, RetryConfig)
{
  {
    std::string config = R"(
      {
        "verbose": true,
        "retry": {
          "max_retry_count": 4,
          "strategy": "none"
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);

    EXPECT_EQ(cfg.retry.max_retry_count, 4);
    EXPECT_EQ(cfg.retry.strategy, Strategy::NONE);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "retry": {
          "max_retry_count": 1,
          "strategy": "exponentialBackoff",
          "delay_ms": 100,
          "max_delay_ms": 1000
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);

    EXPECT_EQ(cfg.retry.max_retry_count, 1);
    EXPECT_EQ(cfg.retry.strategy, Strategy::EXPONENTIAL_BACKOFF);
    EXPECT_EQ(cfg.retry.delay_ms, 100);
    EXPECT_EQ(cfg.retry.max_delay_ms, 1000);
  }

  // Delays are required by strategies with a delay.
  {
    std::string config = R"(
      {
        "verbose": true,
        "retry": {
          "max_retry_count": 1,
          "strategy": "fixedDelay"
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "retry": {
          "max_retry_count": -1,
          "strategy": "none"
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "retry": {
          "max_retry_count": 1,
          "strategy": "random"
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }
}

TEST(Config, HeartbeatConfig)
{
  {
    std::string config = R"(
      {
        "verbose": true,
        "heartbeat": {
          "poll_interval_ms": 500
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);

    EXPECT_EQ(cfg.heartbeat.poll_interval_ms, 500);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "heartbeat": {
          "poll_interval_ms": 0
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }
}

TEST(Config, StorageConfig)
{
  {
    std::string config = R"(
      {
        "verbose": true,
        "storage": {
          "type": "local",
          "root": "/tmp/storage",
          "scan_timeout_ms": 100
        }
      }
    )";

    std::stringstream stream{config};
    Config cfg = Config::deserialize(stream);

    EXPECT_EQ(cfg.storage.storage_type, funcorch::orchestrator::storage::Type::LOCAL);
    EXPECT_EQ(cfg.storage.root, "/tmp/storage");
    EXPECT_EQ(cfg.storage.scan_timeout_ms, 100);
  }

  {
    std::string config = R"(
      {
        "verbose": true,
        "storage": {
          "type": "s3",
          "root": "/tmp/storage",
          "scan_timeout_ms": 100
        }
      }
    )";

    std::stringstream stream{config};
    EXPECT_THROW(Config::deserialize(stream), funcorch::common::InvalidConfigurationError);
  }
}
