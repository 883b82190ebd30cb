#include "ApiClient.hpp"
#include "Config.hpp"
#include "LocalStateStore.hpp"
#include "UploadReconciler.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void usage() {
  std::cerr
      << "Usage:\n"
      << "  modsync-cli sync [dir] [-f|--force-sync] [-u|--force-upload] "
         "[-d|--download-state]\n"
      << "  modsync-cli create [dir] <name> <game> <game_version> "
         "<modloader> <modloader_version>\n"
      << "  modsync-cli delete [dir]" << std::endl;
}

int runSync(const std::string &dir, const modsync::UploadOptions &options) {
  auto config = modsync::loadUploadConfig(
      (fs::path(dir) / "modsync.sync.json").string());
  modsync::ApiClient api(config.server_url, config.api_key);

  auto hello = api.hello();
  std::cout << "[Main] Server version " << hello.version << std::endl;

  modsync::LocalStateStore store(
      (fs::path(dir) / "modsync.state.db").string());
  store.open();

  auto start = std::chrono::steady_clock::now();
  modsync::UploadReconciler reconciler(api, store, config, dir);
  auto report = reconciler.run(options);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  std::cout << "[Main] Sync complete in " << elapsed.count() << " ms: "
            << report.synced << " synced, " << report.uploaded
            << " uploaded, " << report.deduplicated << " already stored, "
            << report.deleted << " deleted." << std::endl;
  for (const auto &error : report.scanErrors)
    std::cerr << "[Main] Skipped: " << error << std::endl;
  return 0;
}

int runCreate(const std::string &dir, const std::vector<std::string> &args) {
  auto config = modsync::loadUploadConfig(
      (fs::path(dir) / "modsync.sync.json").string());
  modsync::ApiClient api(config.server_url, config.api_key);

  modsync::ModpackCreateBody body;
  body.name = args[0];
  body.game = args[1];
  body.game_version = args[2];
  body.modloader = args[3];
  body.modloader_version = args[4];

  std::string id = api.createModpack(body);
  std::cout << "[Main] Created modpack " << body.name << " with id " << id
            << std::endl;
  std::cout << id << std::endl;
  return 0;
}

int runDelete(const std::string &dir) {
  auto config = modsync::loadUploadConfig(
      (fs::path(dir) / "modsync.sync.json").string());
  modsync::ApiClient api(config.server_url, config.api_key);
  api.deleteModpack(config.modpack_id);
  std::cout << "[Main] Deleted modpack " << config.modpack_id << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 2;
  }

  std::string command = argv[1];
  std::vector<std::string> positional;
  modsync::UploadOptions options;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-f" || arg == "--force-sync")
      options.forceSync = true;
    else if (arg == "-u" || arg == "--force-upload")
      options.forceUpload = true;
    else if (arg == "-d" || arg == "--download-state")
      options.seedFromServer = true;
    else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "[Main] Unknown option " << arg << std::endl;
      usage();
      return 2;
    } else
      positional.push_back(arg);
  }

  try {
    if (command == "sync" && positional.size() <= 1)
      return runSync(positional.empty() ? "." : positional[0], options);

    if (command == "create" && positional.size() == 5)
      return runCreate(".", positional);
    if (command == "create" && positional.size() == 6)
      return runCreate(positional[0], std::vector<std::string>(
                                          positional.begin() + 1,
                                          positional.end()));

    if (command == "delete" && positional.size() <= 1)
      return runDelete(positional.empty() ? "." : positional[0]);

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  usage();
  return 2;
}
