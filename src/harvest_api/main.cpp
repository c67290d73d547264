#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "harvest_api/config.hpp"
#include "harvest_api/routes.hpp"
#include "harvest_api/server.hpp"
#include "harvest_api/status_listener.hpp"
#include "harvest_core/db/database_manager.hpp"
#include "harvest_core/db/task_store.hpp"
#include "harvest_core/scheduler/scheduler.hpp"
#include "harvest_core/scheduler/status_channel.hpp"
#include "harvest_core/worker/worker_bridge.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char** argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "harvestrc.json";
    Config config = Config::from_file(config_path);

    const char* key_value = std::getenv(config.database_key_env.c_str());
    std::string db_key = key_value ? key_value : "";
    std::cout << "Starting Harvest API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Database Encryption: " << (db_key.empty() ? "Off" : "On") << std::endl;
    std::cout << "Worker: " << config.worker_executable;
    for (const auto& arg : config.worker_args) {
      std::cout << " " << arg;
    }
    std::cout << std::endl;

    // Initialize core components
    harvest_core::DatabaseManager db_manager;
    db_manager.initialize(config.database_path, db_key, config.db_pool_size);
    auto task_store = std::make_shared<harvest_core::TaskStore>(db_manager);

    // --- 1. RECOVER STATE LEFT BY AN UNCLEAN EXIT ---
    int stuck = task_store->fix_stuck_tasks(std::chrono::minutes(config.stuck_task_threshold_minutes));
    int orphaned = task_store->recover_orphaned_queue_items();
    int purged = task_store->purge_history(std::chrono::hours(24 * config.history_retention_days));
    std::cout << "Startup recovery: " << stuck << " stuck task(s) stopped, " << orphaned
              << " queue item(s) requeued, " << purged << " old task(s) purged" << std::endl;

    auto worker_bridge =
        std::make_shared<harvest_core::WorkerBridge>(*task_store, config.worker_command());
    harvest_core::StatusChannel status_channel;
    auto status_listener = std::make_shared<harvest_api::LatestStatusListener>(
        static_cast<std::size_t>(config.recent_event_buffer));
    status_channel.subscribe(status_listener);

    harvest_core::SchedulerOptions scheduler_options;
    scheduler_options.settle_delay = std::chrono::milliseconds(config.settle_delay_ms);
    auto scheduler = std::make_shared<harvest_core::Scheduler>(*task_store, *worker_bridge,
                                                              status_channel, scheduler_options);

    harvest_api::Server server(config.host(), config.port());
    harvest_api::Routes routes(scheduler, task_store, worker_bridge, status_listener);
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping scheduler (running item returns to pending)..." << std::endl;
    scheduler->shutdown();

    std::cout << "[3/4] Stopping worker processes..." << std::endl;
    worker_bridge->shutdown();

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
