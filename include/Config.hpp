#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modsync {

// Uploader settings, read from <dir>/modsync.sync.json
struct UploadConfig {
  std::string modpack_id;
  std::string server_url;
  std::string api_key;
  std::vector<std::string> include_globs;
  std::vector<std::string> excludes;
};

// Player side settings, read from ./modsync.json
struct ClientConfig {
  std::string modpack_id;
  std::string server_url;
  std::string api_key;
};

struct ServerConfig {
  std::string database_path = "modsync.db";
  std::string master_key;
  uint16_t port = 7040;
  std::string uploads_directory = "uploads";
  size_t file_size_limit = 262144000;
  int request_timeout = 15; // seconds
};

UploadConfig loadUploadConfig(const std::string &path);
ClientConfig loadClientConfig(const std::string &path);

// Optional JSON file at configPath, then MODSYNC_* environment overrides.
// Throws SyncError(ErrorKind::Config) when no master key is set.
ServerConfig loadServerConfig(const std::string &configPath);

} // namespace modsync
