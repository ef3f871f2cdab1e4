#include <curl/curl.h>

#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/http/server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using nove::http::Server;
using nove::observability::IntField;
using nove::observability::StringField;

namespace {

void ShutdownObservability() {
  nove::observability::ShutdownMetrics();
  nove::observability::ShutdownTracing();
  nove::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: nove-api <config.yaml> OR nove-api --config <config.yaml>" << std::endl;
    return 1;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "curl_global_init failed" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = nove::config::ConfigLoader::Load(config_path);

    nove::observability::InitializeLogging(config);
    nove::observability::InitializeTracing(config);
    nove::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = nove::factory::Build(config);

    // ------------------------------------------------------------
    // Serve until SIGINT/SIGTERM
    // ------------------------------------------------------------
    Server server(nove::factory::ToServerOptions(config), app.handler);
    server.Start();
    NOVE_LOG_INFO("NOVE OS API started", {StringField("bind_address", config.server().bind_address()), IntField("port", server.Port())});

    server.Wait();

    NOVE_LOG_INFO("Shutting down NOVE OS API");
    server.Stop();
    app.notifications->Stop();
  } catch (const std::exception& e) {
    NOVE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    exit_code = 2;
  }

  ShutdownObservability();
  curl_global_cleanup();
  return exit_code;
}
