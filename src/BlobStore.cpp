#include "BlobStore.hpp"
#include "SyncError.hpp"
#include "UuidUtils.hpp"
#include <fstream>
#include <iostream>
#include <picosha2.h>

namespace fs = std::filesystem;

namespace modsync {

BlobStore::BlobStore(std::shared_ptr<DatabaseManager> db,
                     fs::path uploadsDirectory)
    : m_db(std::move(db)), m_uploadsDirectory(std::move(uploadsDirectory)) {
  std::error_code ec;
  fs::create_directories(m_uploadsDirectory, ec);
  if (ec)
    throw SyncError(ErrorKind::Io, "cannot create uploads directory " +
                                       m_uploadsDirectory.string() + ": " +
                                       ec.message());
}

fs::path BlobStore::blobPath(const std::string &digest) const {
  return m_uploadsDirectory / digest;
}

bool BlobStore::isDigest(const std::string &text) {
  if (text.size() != 64)
    return false;
  for (char c : text) {
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex)
      return false;
  }
  return true;
}

std::string BlobStore::digestOf(const std::string &bytes) {
  return picosha2::hash256_hex_string(bytes);
}

void BlobStore::writeBlob(const std::string &digest,
                          const std::string &bytes) {
  fs::path target = blobPath(digest);
  fs::path temp = m_uploadsDirectory / (".tmp-" + UuidUtils::generate());

  {
    std::ofstream ofs(temp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      throw SyncError(ErrorKind::Io, "cannot create " + temp.string());
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::error_code ignored;
      fs::remove(temp, ignored);
      throw SyncError(ErrorKind::Io, "write failed for blob " + digest);
    }
  }

  std::error_code ec;
  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw SyncError(ErrorKind::Io,
                    "cannot move blob " + digest + " into place: " +
                        ec.message());
  }
}

FileUploadResponse BlobStore::store(const std::string &modpackId,
                                    const std::string &path,
                                    const std::string &bytes) {
  auto record = m_db->getFileByPath(modpackId, path);
  if (!record)
    throw SyncError(ErrorKind::NotFound,
                    "no synced file " + path + " in modpack " + modpackId);

  std::string digest = digestOf(bytes);

  FileUploadResponse response;
  response.file_id = record->id;
  if (m_db->hasUploadedHash(digest) && fs::exists(blobPath(digest))) {
    response.action = UploadAction::Exists;
    std::cout << "[Blob] " << digest << " already stored, skipping write"
              << std::endl;
  } else {
    writeBlob(digest, bytes);
    response.action = UploadAction::Uploaded;
    std::cout << "[Blob] Stored " << digest << " (" << bytes.size()
              << " bytes)" << std::endl;
  }

  m_db->setUploaded(record->id, digest);
  return response;
}

std::optional<fs::path> BlobStore::locate(const std::string &digest) {
  if (!isDigest(digest) || !m_db->hasUploadedHash(digest))
    return std::nullopt;
  fs::path p = blobPath(digest);
  if (!fs::exists(p))
    return std::nullopt;
  return p;
}

} // namespace modsync
