#include "DatabaseManager.hpp"
#include "UuidUtils.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace modsync {

// Row layout of the "files" table; the state column is stored as text
struct FileRow {
  std::string id;
  std::string modpack;
  std::string created_at;
  std::string updated_at;
  std::string path;
  std::string state;
  int32_t sync_version = 0;
  std::optional<std::string> hash;
  bool uploaded = false;
};

inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_unique_index("i_files_modpack_path", &FileRow::modpack,
                        &FileRow::path),
      make_index("i_files_hash", &FileRow::hash),
      make_table<Modpack>(
          "modpacks", make_column("id", &Modpack::id, primary_key()),
          make_column("name", &Modpack::name, unique()),
          make_column("game", &Modpack::game),
          make_column("game_version", &Modpack::game_version),
          make_column("modloader", &Modpack::modloader),
          make_column("modloader_version", &Modpack::modloader_version),
          make_column("sync_version", &Modpack::sync_version)),
      make_table<FileRow>(
          "files", make_column("id", &FileRow::id, primary_key()),
          make_column("modpack", &FileRow::modpack),
          make_column("created_at", &FileRow::created_at),
          make_column("updated_at", &FileRow::updated_at),
          make_column("path", &FileRow::path),
          make_column("state", &FileRow::state),
          make_column("sync_version", &FileRow::sync_version),
          make_column("hash", &FileRow::hash),
          make_column("uploaded", &FileRow::uploaded)));
}

using Storage = decltype(create_storage_impl(""));

namespace {

FileRecord toRecord(const FileRow &row) {
  FileRecord f;
  f.id = row.id;
  f.modpack = row.modpack;
  f.created_at = row.created_at;
  f.updated_at = row.updated_at;
  f.path = row.path;
  f.state = fileStateFromString(row.state);
  f.sync_version = row.sync_version;
  f.hash = row.hash;
  f.uploaded = row.uploaded;
  return f;
}

} // namespace

struct DatabaseManager::Impl {
  Storage storage;
  std::mutex mtx;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {
    storage.open_forever();
  }
};

DatabaseManager::DatabaseManager(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

void DatabaseManager::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  std::cout << "[DB] Synchronizing schema via sqlite_orm..." << std::endl;
  m_impl->storage.sync_schema(true);
  std::cout << "[DB] Schema synchronized: " << m_dbPath << std::endl;
}

std::optional<Modpack> DatabaseManager::getModpack(const std::string &id) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_optional<Modpack>(id);
}

bool DatabaseManager::insertModpack(const Modpack &modpack) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  bool inserted = false;
  m_impl->storage.transaction([&] {
    auto taken = m_impl->storage.count<Modpack>(
        where(c(&Modpack::name) == modpack.name));
    if (taken > 0)
      return false;
    m_impl->storage.replace(modpack);
    inserted = true;
    return true;
  });
  return inserted;
}

bool DatabaseManager::deleteModpack(const std::string &id) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  bool deleted = false;
  m_impl->storage.transaction([&] {
    if (!m_impl->storage.get_optional<Modpack>(id))
      return false;
    m_impl->storage.remove_all<FileRow>(where(c(&FileRow::modpack) == id));
    m_impl->storage.remove<Modpack>(id);
    deleted = true;
    return true;
  });
  return deleted;
}

std::vector<FileRecord>
DatabaseManager::getFilesByModpack(const std::string &modpackId) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto rows = m_impl->storage.get_all<FileRow>(
      where(c(&FileRow::modpack) == modpackId), order_by(&FileRow::path));
  std::vector<FileRecord> files;
  files.reserve(rows.size());
  for (const auto &row : rows)
    files.push_back(toRecord(row));
  return files;
}

std::optional<FileRecord>
DatabaseManager::getFileByPath(const std::string &modpackId,
                               const std::string &path) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto rows = m_impl->storage.get_all<FileRow>(
      where(c(&FileRow::modpack) == modpackId and c(&FileRow::path) == path),
      limit(1));
  if (rows.empty())
    return std::nullopt;
  return toRecord(rows[0]);
}

FileRecord DatabaseManager::upsertFile(const std::string &modpackId,
                                       const std::string &path,
                                       FileState state,
                                       const std::optional<std::string> &hash) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto now = currentTimestamp();
  auto rows = m_impl->storage.get_all<FileRow>(
      where(c(&FileRow::modpack) == modpackId and c(&FileRow::path) == path),
      limit(1));

  FileRow row;
  if (!rows.empty()) {
    // Metadata only: sync_version and uploaded are left alone
    row = rows[0];
    row.path = path;
    row.state = toString(state);
    row.hash = hash;
    row.updated_at = now;
    m_impl->storage.update(row);
  } else {
    row.id = UuidUtils::generate();
    row.modpack = modpackId;
    row.created_at = now;
    row.updated_at = now;
    row.path = path;
    row.state = toString(state);
    row.sync_version = 0;
    row.hash = hash;
    row.uploaded = false;
    m_impl->storage.replace(row);
  }
  return toRecord(row);
}

bool DatabaseManager::hasUploadedHash(const std::string &hash) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.count<FileRow>(where(
             c(&FileRow::hash) == hash and c(&FileRow::uploaded) == true)) > 0;
}

void DatabaseManager::setUploaded(const std::string &fileId,
                                  const std::string &hash) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  m_impl->storage.update_all(
      set(c(&FileRow::uploaded) = true, c(&FileRow::hash) = hash,
          c(&FileRow::sync_version) = c(&FileRow::sync_version) + 1,
          c(&FileRow::updated_at) = currentTimestamp()),
      where(c(&FileRow::id) == fileId));
}

std::string currentTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace modsync
