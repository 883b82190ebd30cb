#pragma once
#include "types.hpp"
#include <memory>
#include <string>

namespace modsync {

/**
 * LocalStateStore persists the client's bookkeeping in a SQLite file:
 * the uploader's SyncState and the player's ClientFileInfo map. Loads read
 * the whole table; saves replace it inside one transaction, so a run that
 * aborts before saving leaves the previous state untouched.
 *
 * A file that is not a readable modsync state raises
 * SyncError(ErrorKind::CorruptState); nothing is reset automatically.
 */
class LocalStateStore {
public:
  explicit LocalStateStore(const std::string &dbPath);
  ~LocalStateStore();

  void open();

  SyncState loadSyncState();
  void saveSyncState(const SyncState &state);

  ClientFileMap loadClientFiles();
  void saveClientFiles(const ClientFileMap &files);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace modsync
