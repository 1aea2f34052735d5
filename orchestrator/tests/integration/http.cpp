#include <funcorch/common/http.hpp>
#include <funcorch/orchestrator/attempts.hpp>
#include <funcorch/orchestrator/config.hpp>
#include <funcorch/orchestrator/executor.hpp>
#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/http.hpp>
#include <funcorch/orchestrator/indexer.hpp>
#include <funcorch/orchestrator/invoker.hpp>
#include <funcorch/orchestrator/registry.hpp>
#include <funcorch/orchestrator/scanner.hpp>
#include <funcorch/orchestrator/storage.hpp>
#include <funcorch/orchestrator/worker.hpp>

#include <filesystem>
#include <functional>
#include <future>
#include <thread>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace funcorch::orchestrator;

static const std::filesystem::path RETRY_LIBRARY{FUNCORCH_RETRY_LIBRARY};

// All components of a running orchestrator; drogon can run only once per process.
struct Orchestrator {

  static config::HTTPServer http_config()
  {
    config::HTTPServer cfg;
    cfg.port = 18080;
    cfg.threads = 2;
    return cfg;
  }

  static config::Workers workers_config()
  {
    config::Workers cfg;
    cfg.threads = 4;
    return cfg;
  }

  config::HTTPServer http_cfg = http_config();
  config::Workers workers_cfg = workers_config();
  config::Retry retry_cfg;

  storage::LocalBlobStorage storage{std::filesystem::temp_directory_path()};
  Registry registry;
  heartbeat::HeartbeatTracker heartbeats{std::chrono::milliseconds{60 * 1000}};
  attempts::AttemptTable attempts;
  invoker::FunctionInvoker invoker{storage};
  executor::Executor executor{retry_cfg, attempts, invoker, heartbeats};
  scanner::Scanner scanner{storage, registry, std::chrono::milliseconds{1000}};
  indexer::Indexer indexer{registry, scanner};
  worker::Workers workers{workers_cfg, registry, indexer, executor, heartbeats};
  std::shared_ptr<HttpServer> server = std::make_shared<HttpServer>(http_cfg, workers);
};

class HttpServerTest : public ::testing::Test {
protected:
  static void SetUpTestSuite()
  {
    spdlog::set_level(spdlog::level::debug);
    funcorch::common::http::HTTPClientFactory::initialize(1);

    // Stands in for a function deployed behind a URL: the first attempt fails,
    // later ones echo the retry state they received.
    drogon::app().registerHandler(
        "/echo/retry",
        [](const drogon::HttpRequestPtr& request,
           std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
          auto response = drogon::HttpResponse::newHttpResponse();
          if (request->getHeader("X-Retry-Count") == "0") {
            response->setStatusCode(drogon::k500InternalServerError);
            response->setBody("An error occurred");
          } else {
            response->setStatusCode(drogon::k200OK);
            response->setBody(fmt::format(
                "id={} retry={} max={}", request->getHeader("X-Invocation-Id"),
                request->getHeader("X-Retry-Count"), request->getHeader("X-Max-Retry-Count")
            ));
          }
          callback(response);
        },
        {drogon::Post}
    );

    orchestrator = new Orchestrator{};
    orchestrator->server->run();

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  static void TearDownTestSuite()
  {
    orchestrator->server->shutdown();
    orchestrator->server->wait();
    orchestrator->workers.shutdown();
    delete orchestrator;

    funcorch::common::http::HTTPClientFactory::shutdown();
  }

  funcorch::common::http::HTTPClient client()
  {
    return funcorch::common::http::HTTPClientFactory::create_client_shared(
        "http://127.0.0.1", orchestrator->http_cfg.port
    );
  }

  static drogon::HttpResponsePtr wait(std::promise<drogon::HttpResponsePtr>& p)
  {
    auto future = p.get_future();
    EXPECT_EQ(future.wait_for(std::chrono::seconds{10}), std::future_status::ready);
    return future.get();
  }

  static funcorch::common::http::HTTPClient::callback_t
  store(std::promise<drogon::HttpResponsePtr>& p)
  {
    return [&p](drogon::ReqResult result, const drogon::HttpResponsePtr& response) {
      EXPECT_EQ(result, drogon::ReqResult::Ok);
      p.set_value(response);
    };
  }

  static Orchestrator* orchestrator;
};

Orchestrator* HttpServerTest::orchestrator = nullptr;

TEST_F(HttpServerTest, RegisterAndInvokeLibrary)
{
  auto http = client();
  std::string function_id = "local:" + RETRY_LIBRARY.string();

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/functions/library", {{"path", RETRY_LIBRARY.string()}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_EQ((*response->getJsonObject())["count_scanned"].asInt(), 1);
  }

  EXPECT_TRUE(orchestrator->registry.contains(function_id));

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", function_id}, {"invocation_id", "first"}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

    auto json = response->getJsonObject();
    EXPECT_EQ((*json)["output"].asString(), "invocationCount: 2");
    EXPECT_EQ((*json)["attempts"].asInt(), 2);
    EXPECT_EQ((*json)["invocation_id"].asString(), "first");
  }

  // Reusing the id without a reset is an internal consistency failure.
  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", function_id}, {"invocation_id", "first"}}, store(p));
    auto response = wait(p);
    EXPECT_EQ(response->getStatusCode(), drogon::k500InternalServerError);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post(
        "/functions/invoke",
        {{"function", function_id}, {"invocation_id", "first"}, {"reset", "true"}}, store(p)
    );
    auto response = wait(p);
    EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  }

  // Without an id, every call is a fresh logical invocation.
  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", function_id}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_FALSE((*response->getJsonObject())["invocation_id"].asString().empty());
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/delete", {{"function", function_id}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_TRUE((*response->getJsonObject())["deleted"].asBool());
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", function_id}}, store(p));
    auto response = wait(p);
    EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
  }
}

TEST_F(HttpServerTest, RegisterAndInvokeUrl)
{
  auto http = client();
  std::string url = fmt::format("http://127.0.0.1:{}/echo/retry", orchestrator->http_cfg.port);

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/functions/url", {{"url", url}}, store(p));
    ASSERT_EQ(wait(p)->getStatusCode(), drogon::k200OK);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", url}, {"invocation_id", "echo"}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

    auto json = response->getJsonObject();
    ASSERT_TRUE(json);
    EXPECT_EQ((*json)["attempts"].asInt(), 2);
    EXPECT_EQ((*json)["output"].asString(), "id=echo retry=1 max=2");
  }
  EXPECT_EQ(orchestrator->attempts.current("echo"), 1);

  // A server-generated id leaves no counter behind.
  size_t tracked = orchestrator->attempts.size();
  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {{"function", url}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_EQ((*response->getJsonObject())["attempts"].asInt(), 2);
  }
  EXPECT_EQ(orchestrator->attempts.size(), tracked);
}

TEST_F(HttpServerTest, InvalidRequests)
{
  auto http = client();

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.post("/functions/invoke", {}, store(p));
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k400BadRequest);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/functions/url", {{"url", "ftp://localhost/function"}}, store(p));
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k400BadRequest);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put(
        "/functions/url", {{"url", "http://localhost/function"}, {"max_retry_count", "abc"}},
        store(p)
    );
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k400BadRequest);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/functions/scan", {{"account", "acc"}}, store(p));
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k400BadRequest);
  }
}

TEST_F(HttpServerTest, ScanMissingContainer)
{
  auto http = client();

  std::promise<drogon::HttpResponsePtr> p;
  http.put(
      "/functions/scan", {{"account", "funcorch-missing-account"}, {"path", "functions"}},
      store(p)
  );
  auto response = wait(p);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ((*response->getJsonObject())["count_scanned"].asInt(), 0);
}

TEST_F(HttpServerTest, HeartbeatAndListing)
{
  auto http = client();

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/functions/url", {{"url", "http://localhost:7071/api/listed"}}, store(p));
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k200OK);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.get("/hosts/status", {{"assembly", "listed"}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_FALSE((*response->getJsonObject())["live"].asBool());
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.put("/hosts/heartbeat", {{"assembly", "listed"}}, store(p));
    EXPECT_EQ(wait(p)->getStatusCode(), drogon::k200OK);
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.get("/hosts/status", {{"assembly", "listed"}}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_TRUE((*response->getJsonObject())["live"].asBool());
  }

  {
    std::promise<drogon::HttpResponsePtr> p;
    http.get("/functions", {}, store(p));
    auto response = wait(p);
    ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

    auto& groups = (*response->getJsonObject())["functions"];
    bool found = false;
    for (const auto& group : groups) {
      if (group["key"].asString() != "http://localhost:7071/api/listed") {
        continue;
      }
      found = true;
      ASSERT_EQ(group["functions"].size(), 1);
      EXPECT_EQ(group["functions"][0]["location_name"].asString(), "listed");
      EXPECT_TRUE(group["functions"][0]["hostIsRunning"].asBool());
    }
    EXPECT_TRUE(found);
  }
}
