#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/coordinator/lifecycle_coordinator.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/notification_broadcaster.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using bolt::factory::Build;
using bolt::observability::StringField;
using bolt::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;
static std::atomic<bool>          g_terminated{false};

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: bolt-controller [config.yaml] OR bolt-controller --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    bolt::runtime::config::RuntimeConfig config;
    if (config_path.empty()) {
      bolt::config::ConfigLoader::ApplyDefaults(&config);
    } else {
      config = bolt::config::ConfigLoader::LoadFromYaml(config_path);
    }

    bolt::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config, [] { g_terminated.store(true); });

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.coordinator->Start();
    BOLT_LOG_INFO("Controller started", {StringField("bind_address", config.server().bind_address()),
                                         StringField("data_dir", config.storage().data_dir())});

    // Give the presentation layer time to attach before onboarding starts.
    const auto onboarding_at = std::chrono::steady_clock::now() + bolt::config::ToMillis(config.lifecycle().splash_delay());
    bool       onboarding_started = false;

    while (g_running && !g_terminated.load()) {
      if (!onboarding_started && std::chrono::steady_clock::now() >= onboarding_at) {
        onboarding_started = true;
        auto started       = app.coordinator->Submit(bolt::coordinator::Trigger::kStartOnboarding);
        try {
          started.get();
        } catch (const std::exception& e) {
          BOLT_LOG_ERROR("Failed to start onboarding", {StringField("error", e.what())});
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!g_terminated.load()) {
      BOLT_LOG_INFO("Signal received, terminating");
      try {
        app.coordinator->Submit(bolt::coordinator::Trigger::kTerminate).get();
      } catch (const std::exception& e) {
        BOLT_LOG_ERROR("Terminate failed", {StringField("error", e.what())});
      }
    }

    BOLT_LOG_INFO("Shutting down controller");

    app.broadcaster->Close();
    server.Stop();
    app.coordinator->Stop();
    app.relay->DetachSink();
    app.coordinator.reset();
    bolt::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BOLT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    bolt::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
