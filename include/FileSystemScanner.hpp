#ifndef FILESYSTEMSCANNER_HPP
#define FILESYSTEMSCANNER_HPP

#include "PathMatcher.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>

namespace modsync {

class FileSystemScanner {
public:
  FileSystemScanner(std::string syncPath);
  ~FileSystemScanner();

  // Walks the sync root and hashes every tracked regular file. Invalid
  // (non UTF-8) names land in ScanResult::errors instead of aborting.
  ScanResult scanSyncPath(const PathMatcher &matcher);
  std::string toRelativePath(const std::filesystem::path &absPath) const;

  // Lowercase hex SHA-256, streamed from disk
  static std::string calculateHash(const std::string &absPath);
  static bool isValidUtf8(const std::string &text);
  // Relative, no "..", no root name, not empty
  static bool isSafeRelativePath(const std::string &path);
  // Bookkeeping files that live next to the synced tree
  static bool isBookkeepingFile(const std::string &relativePath);

private:
  std::string m_syncPath;
};

} // namespace modsync

#endif // FILESYSTEMSCANNER_HPP
