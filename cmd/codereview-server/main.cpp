#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void PrintUsage() {
  std::cerr << "Usage: codereview-server [--check-config] <config.yaml>\n"
            << "       codereview-server [--check-config] --config <config.yaml>\n";
}

// Flushes exporters and the log sink on every exit path.
struct ObservabilityGuard {
  explicit ObservabilityGuard(const codereview::runtime::config::RuntimeConfig& config) {
    codereview::observability::InitializeTracing(config);
    codereview::observability::InitializeMetrics(config);
    codereview::observability::InitializeLogging(config);
  }

  ~ObservabilityGuard() {
    codereview::observability::ShutdownLogging();
    codereview::observability::ShutdownMetrics();
    codereview::observability::ShutdownTracing();
  }

  ObservabilityGuard(const ObservabilityGuard&)            = delete;
  ObservabilityGuard& operator=(const ObservabilityGuard&) = delete;
};

} // namespace

int main(int argc, char** argv) {
  bool        check_only = false;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return 1;
  }

  codereview::runtime::config::RuntimeConfig config;
  try {
    config = codereview::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "invalid config " << config_path << ": " << e.what() << "\n";
    return 1;
  }
  if (check_only) {
    std::cout << config_path << ": ok\n";
    return 0;
  }

  ObservabilityGuard observability(config);
  using codereview::observability::IntField;
  using codereview::observability::StringField;

  try {
    auto app = codereview::factory::Build(config);

    codereview::runtime::Server server(config.server().bind_address(), app.grpc_services);

    // handlers go in before Start() so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CODEREVIEW_LOG_INFO("Code review server started", {StringField("bind_address", config.server().bind_address()), IntField("port", server.Port()),
                                                       StringField("generator", config.generator().endpoint()),
                                                       StringField("fixed_dir", config.storage().fixed_dir())});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    CODEREVIEW_LOG_INFO("Shutting down code review server");

    // closing the broker ends open Subscribe streams so the server drains
    app.Shutdown();
    server.Shutdown();
  } catch (const std::exception& e) {
    CODEREVIEW_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    return 2;
  }

  return 0;
}
