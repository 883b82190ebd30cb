#include "ModpackStore.hpp"
#include "FileSystemScanner.hpp"
#include "SyncError.hpp"
#include "UuidUtils.hpp"
#include <iostream>

namespace modsync {

ModpackStore::ModpackStore(std::shared_ptr<DatabaseManager> db)
    : m_db(std::move(db)) {}

std::string ModpackStore::create(const ModpackCreateBody &body) {
  if (body.name.empty())
    throw SyncError(ErrorKind::BadRequest, "modpack name is empty");

  Modpack modpack;
  modpack.id = UuidUtils::generate();
  modpack.name = body.name;
  modpack.game = body.game;
  modpack.game_version = body.game_version;
  modpack.modloader = body.modloader;
  modpack.modloader_version = body.modloader_version;
  modpack.sync_version = 0;

  if (!m_db->insertModpack(modpack))
    throw SyncError(ErrorKind::AlreadyExists,
                    "modpack already exists: " + body.name);

  std::cout << "[Store] Created modpack " << modpack.name << " ("
            << modpack.id << ")" << std::endl;
  return modpack.id;
}

void ModpackStore::fileSync(const std::string &modpackId,
                            const FileSyncBody &body) {
  if (!m_db->getModpack(modpackId))
    throw SyncError(ErrorKind::NotFound, "unknown modpack: " + modpackId);
  if (!FileSystemScanner::isSafeRelativePath(body.path))
    throw SyncError(ErrorKind::BadRequest, "invalid path: " + body.path);

  m_db->upsertFile(modpackId, body.path, body.state, body.hash);
}

ModpackResponse ModpackStore::get(const std::string &modpackId) {
  auto modpack = m_db->getModpack(modpackId);
  if (!modpack)
    throw SyncError(ErrorKind::NotFound, "unknown modpack: " + modpackId);

  ModpackResponse response;
  response.modpack = *modpack;
  response.files = m_db->getFilesByModpack(modpackId);
  return response;
}

void ModpackStore::remove(const std::string &modpackId) {
  if (!m_db->deleteModpack(modpackId))
    throw SyncError(ErrorKind::NotFound, "unknown modpack: " + modpackId);
  std::cout << "[Store] Deleted modpack " << modpackId << std::endl;
}

} // namespace modsync
