#pragma once

#include "types.hpp"
#include <string>

namespace modsync {

/**
 * ModpackApi is the client's view of a modsync server. Failures are thrown
 * as SyncError: Authentication for a rejected key, NotFound for unknown
 * modpacks, files or digests, Transport for everything on the wire.
 */
class ModpackApi {
public:
  virtual ~ModpackApi() = default;

  virtual HelloResponse hello() = 0;
  virtual std::string createModpack(const ModpackCreateBody &body) = 0;
  virtual ModpackResponse getModpack(const std::string &modpackId) = 0;
  virtual void deleteModpack(const std::string &modpackId) = 0;

  virtual void fileSync(const std::string &modpackId,
                        const FileSyncBody &body) = 0;
  virtual FileUploadResponse uploadFile(const std::string &modpackId,
                                        const std::string &path,
                                        const std::string &absPath) = 0;

  // Writes the blob's bytes to localAbsPath, truncating it
  virtual void downloadFile(const std::string &hash,
                            const std::string &localAbsPath) = 0;
};

} // namespace modsync
