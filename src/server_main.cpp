#include "Config.hpp"
#include "DatabaseManager.hpp"
#include "ServerApp.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;

// Only touches the lock-free flag; main polls it
static void signalHandler(int) { running.store(false); }

namespace fs = std::filesystem;
int main() {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  std::cout << "Modsync server starting..." << std::endl;

  const char *configEnv = std::getenv("MODSYNC_CONFIG_PATH");
  const std::string configPath = configEnv ? configEnv : "modsync.server.json";

  try {
    modsync::ServerConfig config = modsync::loadServerConfig(configPath);

    if (!fs::exists(config.uploads_directory)) {
      std::cout << "[Main] Creating uploads directory: "
                << config.uploads_directory << std::endl;
      fs::create_directories(config.uploads_directory);
    }

    auto db = std::make_shared<modsync::DatabaseManager>(config.database_path);
    db->initializeSchema();
    std::cout << "[Main] Database initialized." << std::endl;

    modsync::ServerApp app(config, db);
    std::atomic<bool> listenFailed{false};
    std::thread serverThread([&app, &listenFailed] {
      if (!app.listen("0.0.0.0")) {
        listenFailed.store(true);
        running.store(false);
        cv.notify_all();
      }
    });

    {
      std::unique_lock<std::mutex> lock(cv_m);
      while (running.load())
        cv.wait_for(lock, std::chrono::milliseconds(200));
    }
    std::cout << "[Main] Shutting down..." << std::endl;

    app.stop();
    serverThread.join();
    if (listenFailed.load()) {
      std::cerr << "[Main] Error: could not listen on port " << config.port
                << std::endl;
      return 1;
    }
    std::cout << "[Main] Finished." << std::endl;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
