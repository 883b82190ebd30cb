#include "FileSystemScanner.hpp"
#include "SyncError.hpp"
#include <fstream>
#include <iostream>
#include <vector>

// Include picosha2 for hashing
#include <picosha2.h>

namespace fs = std::filesystem;

namespace modsync {

FileSystemScanner::FileSystemScanner(std::string syncPath)
    : m_syncPath(std::move(syncPath)) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string
FileSystemScanner::toRelativePath(const fs::path &absPath) const {
  return absPath.lexically_relative(fs::path(m_syncPath)).generic_string();
}

std::string FileSystemScanner::calculateHash(const std::string &absPath) {
  std::ifstream f(absPath, std::ios::binary);
  if (!f.is_open())
    throw SyncError(ErrorKind::Io, "unable to read " + absPath);

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  if (f.bad())
    throw SyncError(ErrorKind::Io, "read error while hashing " + absPath);
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool FileSystemScanner::isValidUtf8(const std::string &text) {
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t len;
    uint32_t cp;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      len = 2;
      cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3;
      cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > text.size())
      return false;
    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xc0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3f);
    }
    // Overlong forms, surrogates and out of range code points
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10ffff ||
        (cp >= 0xd800 && cp <= 0xdfff))
      return false;
    i += len;
  }
  return true;
}

bool FileSystemScanner::isSafeRelativePath(const std::string &path) {
  if (path.empty() || path.find('\0') != std::string::npos)
    return false;
  fs::path p(path);
  if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
    return false;
  for (const auto &part : p) {
    if (part == "..")
      return false;
  }
  return true;
}

bool FileSystemScanner::isBookkeepingFile(const std::string &relativePath) {
  static const std::string partSuffix = ".modsync-part";
  if (relativePath.size() > partSuffix.size() &&
      relativePath.compare(relativePath.size() - partSuffix.size(),
                           partSuffix.size(), partSuffix) == 0)
    return true;
  return relativePath.find('/') == std::string::npos &&
         relativePath.rfind("modsync.", 0) == 0;
}

ScanResult FileSystemScanner::scanSyncPath(const PathMatcher &matcher) {
  ScanResult result;
  fs::directory_options opts = fs::directory_options::skip_permission_denied;

  if (!fs::is_directory(m_syncPath))
    throw SyncError(ErrorKind::Io, "sync folder not found: " + m_syncPath);

  fs::recursive_directory_iterator it(m_syncPath, opts), end;
  for (; it != end; ++it) {
    const auto &entry = *it;
    std::string relPath = toRelativePath(entry.path());

    if (!isValidUtf8(relPath)) {
      std::string message = "Invalid filename: " + relPath;
      std::cerr << "[Scanner] " << message << std::endl;
      result.errors.push_back(message);
      if (entry.is_directory())
        it.disable_recursion_pending();
      continue;
    }

    if (entry.is_directory()) {
      if (matcher.prunesDirectory(relPath))
        it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file() || isBookkeepingFile(relPath) ||
        !matcher.matches(relPath))
      continue;

    ScannedFile file;
    file.absPath = entry.path().string();
    file.path = relPath;
    file.size = static_cast<int64_t>(entry.file_size());
    file.hash = calculateHash(file.absPath);
    result.files.push_back(file);
  }

  return result;
}

} // namespace modsync
