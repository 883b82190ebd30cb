#include "types.hpp"
#include "SyncError.hpp"

using json = nlohmann::json;

namespace modsync {

namespace {

template <typename T>
void setOptional(json &j, const char *key, const std::optional<T> &value) {
  if (value)
    j[key] = *value;
  else
    j[key] = nullptr;
}

template <typename T>
std::optional<T> getOptional(const json &j, const char *key) {
  if (!j.contains(key) || j.at(key).is_null())
    return std::nullopt;
  return j.at(key).get<T>();
}

} // namespace

std::string toString(FileState state) {
  switch (state) {
  case FileState::Exists:
    return "Exists";
  case FileState::Deleted:
    return "Deleted";
  case FileState::Ignored:
    return "Ignored";
  }
  return "Ignored";
}

std::string toString(FileDirtyness dirty) {
  switch (dirty) {
  case FileDirtyness::Clean:
    return "Clean";
  case FileDirtyness::Created:
    return "Created";
  case FileDirtyness::Updated:
    return "Updated";
  case FileDirtyness::Deleted:
    return "Deleted";
  }
  return "Clean";
}

std::string toString(UploadAction action) {
  return action == UploadAction::Exists ? "Exists" : "Uploaded";
}

FileState fileStateFromString(const std::string &value) {
  if (value == "Exists")
    return FileState::Exists;
  if (value == "Deleted")
    return FileState::Deleted;
  if (value == "Ignored")
    return FileState::Ignored;
  throw SyncError(ErrorKind::BadRequest, "unknown file state: " + value);
}

FileDirtyness dirtynessFromString(const std::string &value) {
  if (value == "Clean")
    return FileDirtyness::Clean;
  if (value == "Created")
    return FileDirtyness::Created;
  if (value == "Updated")
    return FileDirtyness::Updated;
  if (value == "Deleted")
    return FileDirtyness::Deleted;
  throw SyncError(ErrorKind::BadRequest, "unknown dirtyness: " + value);
}

UploadAction uploadActionFromString(const std::string &value) {
  if (value == "Uploaded")
    return UploadAction::Uploaded;
  if (value == "Exists")
    return UploadAction::Exists;
  throw SyncError(ErrorKind::BadRequest, "unknown upload action: " + value);
}

void to_json(json &j, const FileState &state) { j = toString(state); }

void from_json(const json &j, FileState &state) {
  state = fileStateFromString(j.get<std::string>());
}

void to_json(json &j, const UploadAction &action) { j = toString(action); }

void from_json(const json &j, UploadAction &action) {
  action = uploadActionFromString(j.get<std::string>());
}

void to_json(json &j, const Modpack &modpack) {
  j = json{{"id", modpack.id},
           {"name", modpack.name},
           {"game", modpack.game},
           {"game_version", modpack.game_version},
           {"modloader", modpack.modloader},
           {"modloader_version", modpack.modloader_version},
           {"sync_version", modpack.sync_version}};
}

void from_json(const json &j, Modpack &modpack) {
  j.at("id").get_to(modpack.id);
  j.at("name").get_to(modpack.name);
  modpack.game = j.value("game", "");
  modpack.game_version = j.value("game_version", "");
  modpack.modloader = j.value("modloader", "");
  modpack.modloader_version = j.value("modloader_version", "");
  modpack.sync_version = j.value("sync_version", 0);
}

void to_json(json &j, const FileRecord &file) {
  j = json{{"id", file.id},
           {"modpack", file.modpack},
           {"created_at", file.created_at},
           {"updated_at", file.updated_at},
           {"path", file.path},
           {"state", file.state},
           {"sync_version", file.sync_version},
           {"uploaded", file.uploaded}};
  setOptional(j, "hash", file.hash);
}

void from_json(const json &j, FileRecord &file) {
  j.at("id").get_to(file.id);
  j.at("modpack").get_to(file.modpack);
  file.created_at = j.value("created_at", "");
  file.updated_at = j.value("updated_at", "");
  j.at("path").get_to(file.path);
  j.at("state").get_to(file.state);
  j.at("sync_version").get_to(file.sync_version);
  file.hash = getOptional<std::string>(j, "hash");
  file.uploaded = j.value("uploaded", false);
}

void to_json(json &j, const HelloResponse &hello) {
  j = json{{"version", hello.version},
           {"version_number", hello.version_number}};
}

void from_json(const json &j, HelloResponse &hello) {
  j.at("version").get_to(hello.version);
  hello.version_number = j.value("version_number", 0u);
}

void to_json(json &j, const ModpackCreateBody &body) {
  j = json{{"name", body.name},
           {"game", body.game},
           {"game_version", body.game_version},
           {"modloader", body.modloader},
           {"modloader_version", body.modloader_version}};
}

void from_json(const json &j, ModpackCreateBody &body) {
  j.at("name").get_to(body.name);
  j.at("game").get_to(body.game);
  j.at("game_version").get_to(body.game_version);
  j.at("modloader").get_to(body.modloader);
  j.at("modloader_version").get_to(body.modloader_version);
}

void to_json(json &j, const ModpackResponse &response) {
  j = json{{"modpack", response.modpack}, {"files", response.files}};
}

void from_json(const json &j, ModpackResponse &response) {
  j.at("modpack").get_to(response.modpack);
  j.at("files").get_to(response.files);
}

void to_json(json &j, const FileSyncBody &body) {
  j = json{{"path", body.path}, {"state", body.state}};
  setOptional(j, "hash", body.hash);
}

void from_json(const json &j, FileSyncBody &body) {
  j.at("path").get_to(body.path);
  j.at("state").get_to(body.state);
  body.hash = getOptional<std::string>(j, "hash");
}

void to_json(json &j, const FileUploadResponse &response) {
  j = json{{"action", response.action}, {"file_id", response.file_id}};
}

void from_json(const json &j, FileUploadResponse &response) {
  j.at("action").get_to(response.action);
  j.at("file_id").get_to(response.file_id);
}

std::string errorCode(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Authentication:
    return "UNAUTHORIZED";
  case ErrorKind::NotFound:
    return "NOT_FOUND";
  case ErrorKind::AlreadyExists:
    return "ALREADY_EXISTS";
  case ErrorKind::BadRequest:
  case ErrorKind::Encoding:
    return "BAD_REQUEST";
  case ErrorKind::Database:
  case ErrorKind::CorruptState:
    return "DATABASE_ERROR";
  case ErrorKind::Io:
  case ErrorKind::Transport:
  case ErrorKind::Config:
    return "IO_ERROR";
  }
  return "IO_ERROR";
}

} // namespace modsync
