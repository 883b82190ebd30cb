#pragma once
#include "Config.hpp"
#include "FileSystemScanner.hpp"
#include "LocalStateStore.hpp"
#include "ModpackApi.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace modsync {

struct UploadOptions {
  bool forceSync = false;      // push every entry, not only dirty ones
  bool forceUpload = false;    // re-send bytes of every existing entry
  bool seedFromServer = false; // baseline from the server listing
};

struct UploadReport {
  size_t created = 0;
  size_t updated = 0;
  size_t deleted = 0;
  size_t synced = 0;
  size_t uploaded = 0;
  size_t deduplicated = 0;
  std::vector<std::string> scanErrors;
};

/**
 * UploadReconciler runs one scan-diff-push cycle: it compares the scanned
 * tree with the persisted SyncState, sends every dirty entry to the server,
 * uploads bytes for new and changed files and only then persists the state.
 * Any thrown error leaves the persisted state as it was before the run.
 */
class UploadReconciler {
public:
  UploadReconciler(ModpackApi &api, LocalStateStore &stateStore,
                   const UploadConfig &config, const std::string &syncPath);

  UploadReport run(const UploadOptions &options);

  // Server listing as a baseline where every entry is Updated
  SyncState seedFromServer();

  // Marks Created/Updated/Deleted entries in state from one scan
  static void reconcileLocalState(const std::vector<ScannedFile> &scannedFiles,
                                  SyncState &state, UploadReport &report);

  void push(SyncState &state, const UploadOptions &options,
            UploadReport &report);

private:
  ModpackApi &m_api;
  LocalStateStore &m_stateStore;
  UploadConfig m_config;
  std::string m_syncPath;
  FileSystemScanner m_scanner;
};

} // namespace modsync
