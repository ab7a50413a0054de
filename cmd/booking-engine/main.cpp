#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/service_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/worker/housekeeping_worker.hpp"

using booking::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: booking-engine <config.yaml> OR booking-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = booking::config::ConfigLoader::LoadFromYaml(config_path);

    booking::observability::InitializeTracing(config);
    booking::observability::InitializeMetrics(config);
    booking::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto runtime = booking::factory::BuildRuntime(config, booking::grpc::BuildPaymentProvider(config.payment_gateway()));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    Server     server(bind_address, booking::grpc::BuildGrpcServices(runtime.services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    runtime.housekeeping->Start();
    BOOKING_LOG_INFO("Booking engine started", {booking::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BOOKING_LOG_INFO("Shutting down booking engine");

    runtime.housekeeping->Stop();
    server.Stop();
    booking::observability::ShutdownLogging();
    booking::observability::ShutdownMetrics();
    booking::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    BOOKING_LOG_ERROR("Fatal error", {booking::observability::StringField("error", e.what())});
    booking::observability::ShutdownLogging();
    booking::observability::ShutdownMetrics();
    booking::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
