#include "Config.hpp"
#include "SyncError.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace modsync {

namespace {

json readJsonFile(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs)
    throw SyncError(ErrorKind::Config, "No config found at " + path);
  try {
    return json::parse(ifs);
  } catch (const json::exception &e) {
    throw SyncError(ErrorKind::Config,
                    "Invalid config " + path + ": " + e.what());
  }
}

std::string requireString(const json &j, const char *key,
                          const std::string &path) {
  if (!j.contains(key) || !j.at(key).is_string())
    throw SyncError(ErrorKind::Config,
                    std::string("Missing \"") + key + "\" in " + path);
  return j.at(key).get<std::string>();
}

std::string stripTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/')
    url.pop_back();
  return url;
}

const char *env(const char *name) {
  const char *value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

UploadConfig loadUploadConfig(const std::string &path) {
  json j = readJsonFile(path);
  UploadConfig config;
  config.modpack_id = requireString(j, "modpack_id", path);
  config.server_url = stripTrailingSlash(requireString(j, "server_url", path));
  config.api_key = requireString(j, "api_key", path);
  try {
    config.include_globs =
        j.value("include_globs", std::vector<std::string>{});
    config.excludes = j.value("excludes", std::vector<std::string>{});
  } catch (const json::exception &e) {
    throw SyncError(ErrorKind::Config,
                    "Invalid pattern list in " + path + ": " + e.what());
  }
  return config;
}

ClientConfig loadClientConfig(const std::string &path) {
  json j = readJsonFile(path);
  ClientConfig config;
  config.modpack_id = requireString(j, "modpack_id", path);
  config.server_url = stripTrailingSlash(requireString(j, "server_url", path));
  config.api_key = requireString(j, "api_key", path);
  return config;
}

ServerConfig loadServerConfig(const std::string &configPath) {
  ServerConfig config;

  if (std::filesystem::exists(configPath)) {
    json j = readJsonFile(configPath);
    try {
      config.database_path = j.value("database_path", config.database_path);
      config.master_key = j.value("master_key", config.master_key);
      config.port = j.value("port", config.port);
      config.uploads_directory =
          j.value("uploads_directory", config.uploads_directory);
      config.file_size_limit =
          j.value("file_size_limit", config.file_size_limit);
      config.request_timeout =
          j.value("request_timeout", config.request_timeout);
    } catch (const json::exception &e) {
      throw SyncError(ErrorKind::Config,
                      "Invalid config " + configPath + ": " + e.what());
    }
  }

  if (const char *v = env("MODSYNC_DATABASE_PATH"))
    config.database_path = v;
  if (const char *v = env("MODSYNC_MASTER_KEY"))
    config.master_key = v;
  if (const char *v = env("MODSYNC_UPLOADS_DIRECTORY"))
    config.uploads_directory = v;
  if (const char *v = env("MODSYNC_PORT")) {
    try {
      int port = std::stoi(v);
      if (port <= 0 || port > 65535)
        throw std::out_of_range("port");
      config.port = static_cast<uint16_t>(port);
    } catch (const std::exception &) {
      throw SyncError(ErrorKind::Config,
                      std::string("Invalid MODSYNC_PORT: ") + v);
    }
  }

  if (config.master_key.empty())
    throw SyncError(ErrorKind::Config, "No master key set!");
  return config;
}

} // namespace modsync
