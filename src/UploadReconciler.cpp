#include "UploadReconciler.hpp"
#include <filesystem>
#include <iostream>
#include <set>

namespace modsync {

UploadReconciler::UploadReconciler(ModpackApi &api,
                                   LocalStateStore &stateStore,
                                   const UploadConfig &config,
                                   const std::string &syncPath)
    : m_api(api), m_stateStore(stateStore), m_config(config),
      m_syncPath(syncPath), m_scanner(syncPath) {}

SyncState UploadReconciler::seedFromServer() {
  std::cout << "[Upload] Seeding local state from server listing..."
            << std::endl;
  auto modpack = m_api.getModpack(m_config.modpack_id);
  SyncState state;
  for (const auto &record : modpack.files) {
    SyncFile f;
    f.hash = record.hash;
    f.state = record.state;
    f.dirty = FileDirtyness::Updated;
    state[record.path] = f;
  }
  return state;
}

void UploadReconciler::reconcileLocalState(
    const std::vector<ScannedFile> &scannedFiles, SyncState &state,
    UploadReport &report) {
  std::set<std::string> seen;

  for (const auto &scanned : scannedFiles) {
    seen.insert(scanned.path);
    auto it = state.find(scanned.path);
    if (it == state.end()) {
      std::cout << "[Upload] [+] New file: " << scanned.path << std::endl;
      SyncFile f;
      f.hash = scanned.hash;
      f.state = FileState::Exists;
      f.dirty = FileDirtyness::Created;
      state[scanned.path] = f;
      ++report.created;
      continue;
    }

    SyncFile &f = it->second;
    bool hashMismatch = !f.hash || *f.hash != scanned.hash;
    if (hashMismatch || f.state == FileState::Deleted) {
      std::cout << "[Upload] [*] File changed: " << scanned.path << std::endl;
      f.hash = scanned.hash;
      f.state = FileState::Exists;
      f.dirty = FileDirtyness::Updated;
      ++report.updated;
    }
  }

  // Checking removed files
  for (auto &[path, f] : state) {
    if (f.state != FileState::Exists || seen.count(path))
      continue;
    std::cout << "[Upload] [x] File removed: " << path << std::endl;
    f.state = FileState::Deleted;
    f.dirty = FileDirtyness::Deleted;
    ++report.deleted;
  }
}

void UploadReconciler::push(SyncState &state, const UploadOptions &options,
                            UploadReport &report) {
  std::cout << "[Upload] Starting server synchronization..." << std::endl;

  for (auto &[path, f] : state) {
    if (f.dirty == FileDirtyness::Clean && !options.forceSync)
      continue;

    std::cout << "[Upload] [%] Synchronizing " << path << "..." << std::endl;
    m_api.fileSync(m_config.modpack_id, FileSyncBody{path, f.state, f.hash});
    ++report.synced;

    bool contentChanged = f.dirty == FileDirtyness::Created ||
                          f.dirty == FileDirtyness::Updated;
    if (f.state == FileState::Exists &&
        (options.forceUpload || contentChanged)) {
      std::cout << "[Upload] [@] Uploading " << path << "..." << std::endl;
      auto absPath = (std::filesystem::path(m_syncPath) / path).string();
      auto response = m_api.uploadFile(m_config.modpack_id, path, absPath);
      if (response.action == UploadAction::Exists)
        ++report.deduplicated;
      else
        ++report.uploaded;
    }

    f.dirty = FileDirtyness::Clean;
  }
}

UploadReport UploadReconciler::run(const UploadOptions &options) {
  UploadReport report;

  SyncState state = options.seedFromServer ? seedFromServer()
                                           : m_stateStore.loadSyncState();

  PathMatcher matcher(m_config.include_globs, m_config.excludes);
  ScanResult scan = m_scanner.scanSyncPath(matcher);
  report.scanErrors = scan.errors;
  std::cout << "[Upload] Scanned " << scan.files.size() << " files in "
            << m_syncPath << std::endl;

  reconcileLocalState(scan.files, state, report);
  push(state, options, report);

  std::cout << "[Upload] Saving local state..." << std::endl;
  m_stateStore.saveSyncState(state);
  return report;
}

} // namespace modsync
