#include "ApiClient.hpp"
#include "Config.hpp"
#include "DownloadReconciler.hpp"
#include "LocalStateStore.hpp"
#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
  modsync::DownloadOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-f" || arg == "--force-check") {
      options.forceCheck = true;
    } else {
      std::cerr << "Usage: modsync-client [-f|--force-check]" << std::endl;
      return 2;
    }
  }

  try {
    auto config = modsync::loadClientConfig("modsync.json");
    modsync::ApiClient api(config.server_url, config.api_key);

    modsync::LocalStateStore store("modsync.client.db");
    store.open();

    auto start = std::chrono::steady_clock::now();
    modsync::DownloadReconciler reconciler(api, store, config, ".");
    auto report = reconciler.run(options);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "[Main] Update complete in " << elapsed.count() << " ms: "
              << report.downloaded << " downloaded, " << report.redownloaded
              << " redownloaded, " << report.deleted << " deleted, "
              << report.skipped << " skipped." << std::endl;
    if (!report.failures.empty()) {
      std::cerr << "[Main] " << report.failures.size()
                << " files will be retried on the next run:" << std::endl;
      for (const auto &failure : report.failures)
        std::cerr << "[Main]   " << failure << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
