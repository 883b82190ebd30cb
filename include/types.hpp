#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace modsync {

enum class FileState { Exists, Deleted, Ignored };

enum class FileDirtyness { Clean, Created, Updated, Deleted };

enum class UploadAction { Uploaded, Exists };

std::string toString(FileState state);
std::string toString(FileDirtyness dirty);
std::string toString(UploadAction action);

// Unknown values throw SyncError(ErrorKind::BadRequest)
FileState fileStateFromString(const std::string &value);
FileDirtyness dirtynessFromString(const std::string &value);
UploadAction uploadActionFromString(const std::string &value);

struct ScannedFile {
  std::string path; // Relative path from sync root (e.g. "mods/foo.jar")
  std::string absPath;
  std::string hash;
  int64_t size;
};

struct ScanResult {
  std::vector<ScannedFile> files;
  std::vector<std::string> errors;
};

struct Modpack {
  std::string id;
  std::string name;
  std::string game;
  std::string game_version;
  std::string modloader;
  std::string modloader_version;
  int32_t sync_version = 0;
};

struct FileRecord {
  std::string id;
  std::string modpack;
  std::string created_at;
  std::string updated_at;
  std::string path;
  FileState state = FileState::Exists;
  int32_t sync_version = 0;
  std::optional<std::string> hash;
  bool uploaded = false;
};

// Upload side bookkeeping, keyed by relative path
struct SyncFile {
  std::optional<std::string> hash;
  FileState state = FileState::Exists;
  FileDirtyness dirty = FileDirtyness::Clean;
};

using SyncState = std::map<std::string, SyncFile>;

// Download side bookkeeping, keyed by relative path
struct ClientFileInfo {
  int32_t sync_version = 0;
  std::optional<std::string> hash;
  bool dirty = true;
  bool disable_sync = false;
};

using ClientFileMap = std::map<std::string, ClientFileInfo>;

struct HelloResponse {
  std::string version;
  uint32_t version_number = 0;
};

struct ModpackCreateBody {
  std::string name;
  std::string game;
  std::string game_version;
  std::string modloader;
  std::string modloader_version;
};

struct ModpackResponse {
  Modpack modpack;
  std::vector<FileRecord> files;
};

struct FileSyncBody {
  std::string path;
  FileState state = FileState::Exists;
  std::optional<std::string> hash;
};

struct FileUploadResponse {
  UploadAction action = UploadAction::Uploaded;
  std::string file_id;
};

void to_json(nlohmann::json &j, const FileState &state);
void from_json(const nlohmann::json &j, FileState &state);
void to_json(nlohmann::json &j, const UploadAction &action);
void from_json(const nlohmann::json &j, UploadAction &action);

void to_json(nlohmann::json &j, const Modpack &modpack);
void from_json(const nlohmann::json &j, Modpack &modpack);
void to_json(nlohmann::json &j, const FileRecord &file);
void from_json(const nlohmann::json &j, FileRecord &file);
void to_json(nlohmann::json &j, const HelloResponse &hello);
void from_json(const nlohmann::json &j, HelloResponse &hello);
void to_json(nlohmann::json &j, const ModpackCreateBody &body);
void from_json(const nlohmann::json &j, ModpackCreateBody &body);
void to_json(nlohmann::json &j, const ModpackResponse &response);
void from_json(const nlohmann::json &j, ModpackResponse &response);
void to_json(nlohmann::json &j, const FileSyncBody &body);
void from_json(const nlohmann::json &j, FileSyncBody &body);
void to_json(nlohmann::json &j, const FileUploadResponse &response);
void from_json(const nlohmann::json &j, FileUploadResponse &response);

} // namespace modsync
