#include "DownloadReconciler.hpp"
#include "FileSystemScanner.hpp"
#include "SyncError.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace modsync {

DownloadReconciler::DownloadReconciler(ModpackApi &api,
                                       LocalStateStore &stateStore,
                                       const ClientConfig &config,
                                       const std::string &syncPath)
    : m_api(api), m_stateStore(stateStore), m_config(config),
      m_syncPath(syncPath) {}

bool DownloadReconciler::fetch(const FileRecord &record,
                               const std::string &absPath,
                               DownloadReport &report) {
  if (!record.hash) {
    report.failures.push_back(record.path + ": not uploaded yet");
    std::cerr << "[Download] " << record.path << " has no content yet"
              << std::endl;
    return false;
  }

  fs::path target(absPath);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    throw SyncError(ErrorKind::Io, "cannot create " +
                                       target.parent_path().string() + ": " +
                                       ec.message());

  std::string temp = absPath + ".modsync-part";
  try {
    m_api.downloadFile(*record.hash, temp);
  } catch (const SyncError &e) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    if (e.kind() != ErrorKind::NotFound)
      throw;
    report.failures.push_back(record.path + ": " + e.what());
    std::cerr << "[Download] Skipping " << record.path << ": " << e.what()
              << std::endl;
    return false;
  }

  std::string received = FileSystemScanner::calculateHash(temp);
  if (received != *record.hash) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    report.failures.push_back(record.path + ": digest mismatch");
    std::cerr << "[Download] Digest mismatch for " << record.path
              << ", expected " << *record.hash << " got " << received
              << std::endl;
    return false;
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw SyncError(ErrorKind::Io,
                    "cannot move " + temp + " into place: " + ec.message());
  }
  return true;
}

void DownloadReconciler::apply(const ModpackResponse &modpack,
                               ClientFileMap &files,
                               const DownloadOptions &options,
                               DownloadReport &report) {
  for (const auto &record : modpack.files) {
    if (record.state == FileState::Ignored)
      continue;
    const std::string &path = record.path;
    if (!FileSystemScanner::isSafeRelativePath(path)) {
      report.failures.push_back(path + ": unsafe path");
      std::cerr << "[Download] Refusing unsafe path " << path << std::endl;
      ++report.skipped;
      continue;
    }
    if (FileSystemScanner::isBookkeepingFile(path)) {
      report.failures.push_back(path + ": reserved name");
      std::cerr << "[Download] Refusing to overwrite " << path << std::endl;
      ++report.skipped;
      continue;
    }

    auto it = files.find(path);
    if (it == files.end()) {
      ClientFileInfo fresh;
      fresh.sync_version = record.sync_version;
      it = files.emplace(path, fresh).first;
    }
    ClientFileInfo &info = it->second;
    if (info.disable_sync) {
      ++report.skipped;
      continue;
    }

    std::string absPath = (fs::path(m_syncPath) / path).string();
    bool present = fs::exists(absPath);
    bool ok = true;

    if (record.state == FileState::Exists) {
      if (!present) {
        std::cout << "[Download] [+] File " << path << " added, downloading..."
                  << std::endl;
        ok = fetch(record, absPath, report);
        if (ok)
          ++report.downloaded;
      } else if (info.dirty || record.sync_version > info.sync_version ||
                 options.forceCheck) {
        std::cout << "[Download] [*] Checking file " << path << "..."
                  << std::endl;
        std::string local = FileSystemScanner::calculateHash(absPath);
        if (record.hash != local) {
          std::cout << "[Download] [#] " << path
                    << " was updated, redownloading..." << std::endl;
          ok = fetch(record, absPath, report);
          if (ok)
            ++report.redownloaded;
        } else {
          ++report.verified;
        }
      }
    } else if (record.state == FileState::Deleted && present) {
      std::error_code ec;
      fs::remove(absPath, ec);
      if (ec)
        throw SyncError(ErrorKind::Io,
                        "cannot remove " + absPath + ": " + ec.message());
      std::cout << "[Download] [-] " << path << " is removed." << std::endl;
      ++report.deleted;
    }

    if (ok) {
      info.sync_version = record.sync_version;
      info.hash = record.hash;
      info.dirty = false;
    } else {
      info.dirty = true;
    }
  }
}

DownloadReport DownloadReconciler::run(const DownloadOptions &options) {
  DownloadReport report;
  ClientFileMap files = m_stateStore.loadClientFiles();

  auto modpack = m_api.getModpack(m_config.modpack_id);
  std::cout << "[Download] Modpack " << modpack.modpack.name << " from "
            << m_config.server_url << " (" << modpack.files.size()
            << " files)" << std::endl;

  apply(modpack, files, options, report);

  m_stateStore.saveClientFiles(files);
  return report;
}

} // namespace modsync
