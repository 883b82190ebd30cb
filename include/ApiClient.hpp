#pragma once

#include "ModpackApi.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace modsync {

/**
 * ApiClient handles communication with the modsync server.
 * Uses cpp-httplib for networking and nlohmann/json for serialization.
 * One keep-alive connection is reused for the whole run.
 */
class ApiClient : public ModpackApi {
public:
  ApiClient(const std::string &baseUrl, const std::string &apiKey);
  ~ApiClient() override;

  HelloResponse hello() override;
  std::string createModpack(const ModpackCreateBody &body) override;
  ModpackResponse getModpack(const std::string &modpackId) override;
  void deleteModpack(const std::string &modpackId) override;

  void fileSync(const std::string &modpackId,
                const FileSyncBody &body) override;
  FileUploadResponse uploadFile(const std::string &modpackId,
                                const std::string &path,
                                const std::string &absPath) override;

  void downloadFile(const std::string &hash,
                    const std::string &localAbsPath) override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_baseUrl;
};

std::string urlEncode(const std::string &value);

} // namespace modsync
