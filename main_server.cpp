#include "booking_error.hpp"
#include "cinema_engine.hpp"
#include "engine_config.hpp"
#include "view_json.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

int main(int argc, char* argv[]) {
  std::string config_path;
  bool serve = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--serve") {
      serve = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "usage: " << argv[0] << " [config.json] [--serve]" << std::endl;
      return 0;
    } else {
      config_path = arg;
    }
  }

  try {
    cinema::CinemaEngine::Config config;
    if (!config_path.empty()) {
      config = cinema::loadEngineConfig(config_path);
    }

    std::cout << "=== Cinema Booking Engine ===" << std::endl;
    std::cout << "Backend: " << config.backend << std::endl;
    std::cout << "Worker threads: " << config.worker_threads << std::endl;
    if (config.backend == "postgres") {
      std::cout << "Database: " << config.db_username << "@" << config.db_host << ":"
                << config.db_port << "/" << config.db_name << std::endl;
    }
    std::cout << "=============================" << std::endl;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    cinema::CinemaEngine engine(config);
    if (!engine.initialize()) {
      std::cerr << "Failed to initialize cinema engine" << std::endl;
      return 1;
    }

    nlohmann::json snapshot;
    snapshot["schedules"] = engine.schedules().List();
    snapshot["bookings"] = engine.reservations().List();
    snapshot["payments"] = engine.payments().List();
    std::cout << snapshot.dump(2) << std::endl;

    while (serve && running) {
      std::this_thread::sleep_for(std::chrono::seconds(5));

      auto stats = engine.processor().getStats();
      std::cout << "\n--- Engine Statistics ---" << std::endl;
      std::cout << "Requests processed: " << stats.requests_processed << std::endl;
      std::cout << "Requests in queue: " << stats.requests_queued << std::endl;
      std::cout << "Avg processing time: " << stats.avg_processing_time_ms << " ms" << std::endl;
      std::cout << "-------------------------" << std::endl;
    }

    std::cout << engine.metrics().exportMetrics();
    engine.shutdown();

  } catch (const cinema::BookingError& e) {
    std::cerr << "Engine error [" << cinema::errorKindName(e.kind()) << "]: " << e.what()
              << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Engine error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Shutdown complete." << std::endl;
  return 0;
}
