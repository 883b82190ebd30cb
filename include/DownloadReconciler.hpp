#pragma once
#include "Config.hpp"
#include "LocalStateStore.hpp"
#include "ModpackApi.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace modsync {

struct DownloadOptions {
  bool forceCheck = false; // rehash every present file
};

struct DownloadReport {
  size_t downloaded = 0;
  size_t redownloaded = 0;
  size_t verified = 0;
  size_t deleted = 0;
  size_t skipped = 0;
  std::vector<std::string> failures;
};

/**
 * DownloadReconciler brings the local tree in line with the server's
 * listing: missing files are fetched by digest, stale ones re-fetched,
 * deleted ones removed. The ClientFileMap is persisted once, after the
 * whole pass.
 */
class DownloadReconciler {
public:
  DownloadReconciler(ModpackApi &api, LocalStateStore &stateStore,
                     const ClientConfig &config, const std::string &syncPath);

  DownloadReport run(const DownloadOptions &options);

  // Applies one listing to the tree and to files, without persisting
  void apply(const ModpackResponse &modpack, ClientFileMap &files,
             const DownloadOptions &options, DownloadReport &report);

private:
  ModpackApi &m_api;
  LocalStateStore &m_stateStore;
  ClientConfig m_config;
  std::string m_syncPath;

  // Fetches into a sibling temp file and renames it over the target once
  // the digest matches. False when this file has to be retried later.
  bool fetch(const FileRecord &record, const std::string &absPath,
             DownloadReport &report);
};

} // namespace modsync
