#include "LocalStateStore.hpp"
#include "SyncError.hpp"
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>
#include <system_error>

using namespace sqlite_orm;

namespace modsync {

struct SyncFileRow {
  std::string path;
  std::optional<std::string> hash;
  std::string state;
  std::string dirty;
};

struct ClientFileRow {
  std::string path;
  int32_t sync_version = 0;
  std::optional<std::string> hash;
  bool dirty = true;
  bool disable_sync = false;
};

inline auto create_state_storage(const std::string &path) {
  return make_storage(
      path,
      make_table<SyncFileRow>(
          "sync_files", make_column("path", &SyncFileRow::path, primary_key()),
          make_column("hash", &SyncFileRow::hash),
          make_column("state", &SyncFileRow::state),
          make_column("dirty", &SyncFileRow::dirty)),
      make_table<ClientFileRow>(
          "client_files",
          make_column("path", &ClientFileRow::path, primary_key()),
          make_column("sync_version", &ClientFileRow::sync_version),
          make_column("hash", &ClientFileRow::hash),
          make_column("dirty", &ClientFileRow::dirty),
          make_column("disable_sync", &ClientFileRow::disable_sync)));
}

using StateStorage = decltype(create_state_storage(""));

struct LocalStateStore::Impl {
  StateStorage storage;
  Impl(const std::string &path) : storage(create_state_storage(path)) {}
};

LocalStateStore::LocalStateStore(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

LocalStateStore::~LocalStateStore() = default;

void LocalStateStore::open() {
  try {
    m_impl->storage.open_forever();
    m_impl->storage.sync_schema(true);
  } catch (const std::system_error &e) {
    throw SyncError(ErrorKind::CorruptState,
                    "cannot open local state " + m_dbPath + ": " + e.what());
  }
}

SyncState LocalStateStore::loadSyncState() {
  SyncState state;
  try {
    for (const auto &row : m_impl->storage.get_all<SyncFileRow>()) {
      SyncFile f;
      f.hash = row.hash;
      f.state = fileStateFromString(row.state);
      f.dirty = dirtynessFromString(row.dirty);
      state[row.path] = f;
    }
  } catch (const std::exception &e) {
    throw SyncError(ErrorKind::CorruptState,
                    "cannot read sync state from " + m_dbPath + ": " +
                        e.what());
  }
  return state;
}

void LocalStateStore::saveSyncState(const SyncState &state) {
  try {
    m_impl->storage.transaction([&] {
      m_impl->storage.remove_all<SyncFileRow>();
      for (const auto &[path, f] : state) {
        m_impl->storage.replace(
            SyncFileRow{path, f.hash, toString(f.state), toString(f.dirty)});
      }
      return true;
    });
  } catch (const std::system_error &e) {
    throw SyncError(ErrorKind::Io, "cannot save sync state to " + m_dbPath +
                                       ": " + e.what());
  }
  std::cout << "[State] Saved " << state.size() << " entries to " << m_dbPath
            << std::endl;
}

ClientFileMap LocalStateStore::loadClientFiles() {
  ClientFileMap files;
  try {
    for (const auto &row : m_impl->storage.get_all<ClientFileRow>()) {
      ClientFileInfo info;
      info.sync_version = row.sync_version;
      info.hash = row.hash;
      info.dirty = row.dirty;
      info.disable_sync = row.disable_sync;
      files[row.path] = info;
    }
  } catch (const std::system_error &e) {
    throw SyncError(ErrorKind::CorruptState,
                    "cannot read file info from " + m_dbPath + ": " +
                        e.what());
  }
  return files;
}

void LocalStateStore::saveClientFiles(const ClientFileMap &files) {
  try {
    m_impl->storage.transaction([&] {
      m_impl->storage.remove_all<ClientFileRow>();
      for (const auto &[path, info] : files) {
        m_impl->storage.replace(ClientFileRow{path, info.sync_version,
                                              info.hash, info.dirty,
                                              info.disable_sync});
      }
      return true;
    });
  } catch (const std::system_error &e) {
    throw SyncError(ErrorKind::Io, "cannot save file info to " + m_dbPath +
                                       ": " + e.what());
  }
  std::cout << "[State] Saved " << files.size() << " entries to " << m_dbPath
            << std::endl;
}

} // namespace modsync
