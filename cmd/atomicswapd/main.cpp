#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/monitor/refund_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

namespace obs = atomicswap::observability;

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

constexpr const char* kUsage = "usage: atomicswapd [--config] <config.yaml>";

// Accepts "<path>" or "--config <path>".
std::optional<std::string> ConfigPath(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) != "--config") return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

// Flushes exporters and the logger on every exit path once logging is up.
class ObservabilitySession {
 public:
  explicit ObservabilitySession(const atomicswap::runtime::config::RuntimeConfig& config) {
    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);
    obs::InitializeLogging(config);
  }
  ~ObservabilitySession() {
    obs::ShutdownLogging();
    obs::ShutdownMetrics();
    obs::ShutdownTracing();
  }

  ObservabilitySession(const ObservabilitySession&)            = delete;
  ObservabilitySession& operator=(const ObservabilitySession&) = delete;
};

int Run(const std::string& config_path) {
  const auto           config = atomicswap::config::ConfigLoader::LoadFromYaml(config_path);
  ObservabilitySession session(config);

  try {
    auto app = atomicswap::factory::Build(config, std::make_shared<atomicswap::util::SystemClock>());

    const std::string bind_address =
        config.server().bind_address().empty() ? atomicswap::config::defaults::kBindAddress : config.server().bind_address();
    atomicswap::runtime::Server server(bind_address, std::move(app.grpc_services));

    // Installed before Start() so an early signal is not lost.
    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    server.Start();
    if (app.refund_monitor) app.refund_monitor->Start();
    ATOMICSWAP_LOG_INFO("atomicswapd started",
                        {obs::StringField("bind_address", bind_address), obs::BoolField("refund_monitor", app.refund_monitor != nullptr)});

    while (!g_stop_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    ATOMICSWAP_LOG_INFO("atomicswapd stopping");
    if (app.refund_monitor) app.refund_monitor->Stop();
    server.Stop();
    return 0;
  } catch (const std::exception& e) {
    ATOMICSWAP_LOG_ERROR("atomicswapd failed", {obs::StringField("error", e.what())});
    return 2;
  }
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPath(argc, argv);
  if (!config_path) {
    std::cerr << kUsage << std::endl;
    return 1;
  }

  try {
    return Run(*config_path);
  } catch (const std::exception& e) {
    // Config errors land here, before logging is configured.
    std::cerr << "atomicswapd: " << e.what() << std::endl;
    return 2;
  }
}
