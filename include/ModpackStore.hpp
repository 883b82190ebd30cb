#pragma once
#include "DatabaseManager.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace modsync {

/**
 * ModpackStore is the authoritative record of every modpack and its tracked
 * files. All clients reconcile against the snapshot returned by get().
 */
class ModpackStore {
public:
  explicit ModpackStore(std::shared_ptr<DatabaseManager> db);

  // Returns the new modpack id; AlreadyExists when the name is taken
  std::string create(const ModpackCreateBody &body);

  // Idempotent upsert of one path's metadata; never bumps sync_version
  void fileSync(const std::string &modpackId, const FileSyncBody &body);

  ModpackResponse get(const std::string &modpackId);

  // Cascades to the modpack's files, leaves blobs on disk
  void remove(const std::string &modpackId);

private:
  std::shared_ptr<DatabaseManager> m_db;
};

} // namespace modsync
