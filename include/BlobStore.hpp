#pragma once
#include "DatabaseManager.hpp"
#include "types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace modsync {

/**
 * BlobStore keeps uploaded bytes in a flat directory, one file per SHA-256
 * digest. The digest is always computed here; a client supplied hash is
 * never trusted for storage identity.
 *
 * Writes go to a unique temporary name and are renamed onto the digest
 * name, so two concurrent uploads of the same content both succeed and
 * leave one complete blob behind.
 */
class BlobStore {
public:
  BlobStore(std::shared_ptr<DatabaseManager> db,
            std::filesystem::path uploadsDirectory);

  // NotFound unless (modpackId, path) already has a FileRecord
  FileUploadResponse store(const std::string &modpackId,
                           const std::string &path, const std::string &bytes);

  // Path of a downloadable blob: some record has this hash uploaded and the
  // bytes are present
  std::optional<std::filesystem::path> locate(const std::string &digest);

  std::filesystem::path blobPath(const std::string &digest) const;
  static bool isDigest(const std::string &text);
  static std::string digestOf(const std::string &bytes);

private:
  std::shared_ptr<DatabaseManager> m_db;
  std::filesystem::path m_uploadsDirectory;

  void writeBlob(const std::string &digest, const std::string &bytes);
};

} // namespace modsync
