#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modsync {

/**
 * DatabaseManager owns the server's SQLite handle (via sqlite_orm). One
 * instance is shared by every request handler; calls are serialized on an
 * internal mutex and each write is a single committed statement or
 * transaction. sqlite_orm failures surface as std::system_error.
 */
class DatabaseManager {
public:
  explicit DatabaseManager(const std::string &dbPath);
  ~DatabaseManager();

  void initializeSchema();

  // Modpack operations
  std::optional<Modpack> getModpack(const std::string &id);
  bool insertModpack(const Modpack &modpack);
  bool deleteModpack(const std::string &id);

  // File operations
  std::vector<FileRecord> getFilesByModpack(const std::string &modpackId);
  std::optional<FileRecord> getFileByPath(const std::string &modpackId,
                                          const std::string &path);
  FileRecord upsertFile(const std::string &modpackId, const std::string &path,
                        FileState state,
                        const std::optional<std::string> &hash);
  bool hasUploadedHash(const std::string &hash);
  void setUploaded(const std::string &fileId, const std::string &hash);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

// UTC timestamp, e.g. "2024-10-03T11:29:19Z"
std::string currentTimestamp();

} // namespace modsync
