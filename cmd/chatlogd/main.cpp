#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  chatlog::observability::ShutdownLogging();
  chatlog::observability::ShutdownMetrics();
  chatlog::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: chatlogd <config.yaml> OR chatlogd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chatlog::config::ConfigLoader::LoadFromYaml(config_path);

    chatlog::observability::InitializeTracing(config);
    chatlog::observability::InitializeMetrics(config);
    chatlog::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = chatlog::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Start background workers
    // ------------------------------------------------------------
    if (config.projector().enabled()) app.projector->Start();
    if (config.recovery().enabled()) app.recovery->Start();

    CHATLOG_LOG_INFO("chatlogd started", {chatlog::observability::BoolField("projector", config.projector().enabled()),
                                          chatlog::observability::BoolField("recovery", config.recovery().enabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHATLOG_LOG_INFO("shutting down chatlogd");

    app.recovery->Stop();
    app.projector->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    CHATLOG_LOG_ERROR("fatal error", {chatlog::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
