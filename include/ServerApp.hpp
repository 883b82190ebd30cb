#pragma once
#include "Config.hpp"
#include "DatabaseManager.hpp"
#include <memory>
#include <string>

namespace modsync {

/**
 * ServerApp exposes ModpackStore and BlobStore over HTTP (cpp-httplib).
 * Every route but the banner and the digest download requires
 * "Authorization: Bearer <master_key>". Requests run on httplib's worker
 * pool; the shared DatabaseManager serializes database access.
 */
class ServerApp {
public:
  ServerApp(const ServerConfig &config, std::shared_ptr<DatabaseManager> db);
  ~ServerApp();

  // Blocks until stop() is called
  bool listen(const std::string &host);

  // Split variant used when the port is picked by the OS
  int bindToAnyPort(const std::string &host);
  bool listenAfterBind();
  void waitUntilReady();

  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace modsync
