#include "ServerApp.hpp"
#include "BlobStore.hpp"
#include "GzipStream.hpp"
#include "ModpackStore.hpp"
#include "SyncError.hpp"
#include "httplib.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <system_error>

#ifndef MODSYNC_VERSION
#define MODSYNC_VERSION "0.0.0"
#endif
#ifndef MODSYNC_PROTOCOL_VERSION
#define MODSYNC_PROTOCOL_VERSION 0
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace modsync {

namespace {

constexpr size_t kChunkSize = 32 * 1024;

int statusFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Authentication:
    return 401;
  case ErrorKind::NotFound:
    return 404;
  case ErrorKind::AlreadyExists:
  case ErrorKind::BadRequest:
  case ErrorKind::Encoding:
    return 400;
  default:
    return 500;
  }
}

void sendError(httplib::Response &res, int status, const std::string &code) {
  res.status = status;
  res.set_content(json{{"error", code}}.dump(), "application/json");
}

void sendJson(httplib::Response &res, const json &body) {
  res.status = 200;
  res.set_content(body.dump(), "application/json");
}

template <typename Fn> httplib::Server::Handler guarded(Fn fn) {
  return [fn](const httplib::Request &req, httplib::Response &res) {
    try {
      fn(req, res);
    } catch (const SyncError &e) {
      if (statusFor(e.kind()) >= 500)
        std::cerr << "[Server] " << req.path << ": " << e.what() << std::endl;
      sendError(res, statusFor(e.kind()), errorCode(e.kind()));
    } catch (const json::exception &e) {
      sendError(res, 400, "BAD_REQUEST");
    } catch (const fs::filesystem_error &e) {
      std::cerr << "[Server] " << req.path << ": " << e.what() << std::endl;
      sendError(res, 500, "IO_ERROR");
    } catch (const std::system_error &e) {
      std::cerr << "[Server] " << req.path << ": " << e.what() << std::endl;
      sendError(res, 500, "DATABASE_ERROR");
    } catch (const std::exception &e) {
      std::cerr << "[Server] " << req.path << ": " << e.what() << std::endl;
      sendError(res, 500, "IO_ERROR");
    }
  };
}

bool acceptsGzip(const httplib::Request &req) {
  return req.get_header_value("Accept-Encoding").find("gzip") !=
         std::string::npos;
}

} // namespace

struct ServerApp::Impl {
  ServerConfig config;
  std::shared_ptr<DatabaseManager> db;
  ModpackStore modpacks;
  BlobStore blobs;
  httplib::Server server;

  Impl(const ServerConfig &cfg, std::shared_ptr<DatabaseManager> database)
      : config(cfg), db(std::move(database)), modpacks(db),
        blobs(db, cfg.uploads_directory) {
    server.set_payload_max_length(config.file_size_limit);
    server.set_read_timeout(config.request_timeout, 0);
    server.set_write_timeout(config.request_timeout, 0);
    server.set_logger(
        [](const httplib::Request &req, const httplib::Response &res) {
          std::cout << "[Server] " << req.method << " " << req.path << " -> "
                    << res.status << std::endl;
        });
    server.set_pre_routing_handler(
        [this](const httplib::Request &req, httplib::Response &res) {
          if (isPublic(req.path) || isAuthorized(req))
            return httplib::Server::HandlerResponse::Unhandled;
          sendError(res, 401, "UNAUTHORIZED");
          return httplib::Server::HandlerResponse::Handled;
        });
    setupRoutes();
  }

  static bool isPublic(const std::string &path) {
    return path == "/" || path.rfind("/dl/hash/", 0) == 0;
  }

  bool isAuthorized(const httplib::Request &req) const {
    return req.get_header_value("Authorization") ==
           "Bearer " + config.master_key;
  }

  void setupRoutes() {
    server.Get("/", [](const httplib::Request &, httplib::Response &res) {
      res.set_content("Modsync server v" MODSYNC_VERSION, "text/plain");
    });

    server.Post("/hello",
                guarded([](const httplib::Request &, httplib::Response &res) {
                  sendJson(res, HelloResponse{MODSYNC_VERSION,
                                              MODSYNC_PROTOCOL_VERSION});
                }));

    server.Post("/modpack/create",
                guarded([this](const httplib::Request &req,
                               httplib::Response &res) {
                  auto body = json::parse(req.body).get<ModpackCreateBody>();
                  sendJson(res, {{"modpack_id", modpacks.create(body)}});
                }));

    server.Get("/modpack/:id", guarded([this](const httplib::Request &req,
                                              httplib::Response &res) {
                 sendJson(res, modpacks.get(req.path_params.at("id")));
               }));

    server.Post("/modpack/:id/filesync",
                guarded([this](const httplib::Request &req,
                               httplib::Response &res) {
                  auto body = json::parse(req.body).get<FileSyncBody>();
                  modpacks.fileSync(req.path_params.at("id"), body);
                  sendJson(res, json::object());
                }));

    server.Post("/modpack/:id/delete",
                guarded([this](const httplib::Request &req,
                               httplib::Response &res) {
                  modpacks.remove(req.path_params.at("id"));
                  sendJson(res, {{"success", true}});
                }));

    server.Post("/modpack/:id/upload",
                guarded([this](const httplib::Request &req,
                               httplib::Response &res) {
                  handleUpload(req, res);
                }));

    server.Get("/dl/hash/:digest",
               guarded([this](const httplib::Request &req,
                              httplib::Response &res) {
                 handleDownload(req, res);
               }));
  }

  void handleUpload(const httplib::Request &req, httplib::Response &res) {
    std::string filePath = req.get_param_value("file_path");
    if (filePath.empty())
      throw SyncError(ErrorKind::BadRequest, "missing file_path");
    if (!req.is_multipart_form_data() || req.form.files.empty())
      throw SyncError(ErrorKind::BadRequest, "missing upload field");

    // Only the first field is read
    const auto &part = req.form.files.begin()->second;
    auto response =
        blobs.store(req.path_params.at("id"), filePath, part.content);
    sendJson(res, response);
  }

  void handleDownload(const httplib::Request &req, httplib::Response &res) {
    std::string digest = req.path_params.at("digest");
    auto blob = blobs.locate(digest);
    if (!blob)
      throw SyncError(ErrorKind::NotFound, "unknown digest " + digest);

    auto in = std::make_shared<std::ifstream>(*blob, std::ios::binary);
    if (!*in)
      throw SyncError(ErrorKind::Io, "cannot open blob " + digest);
    auto size = static_cast<size_t>(fs::file_size(*blob));

    if (acceptsGzip(req)) {
      auto gz = std::make_shared<GzipStream>();
      res.set_header("Content-Encoding", "gzip");
      res.set_chunked_content_provider(
          "application/octet-stream",
          [in, gz](size_t, httplib::DataSink &sink) {
            std::string buffer(kChunkSize, '\0');
            in->read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<size_t>(in->gcount());
            if (in->bad())
              return false;
            if (n > 0) {
              auto out = gz->write(buffer.data(), n);
              if (!out.empty() && !sink.write(out.data(), out.size()))
                return false;
            }
            if (in->eof()) {
              auto tail = gz->finish();
              if (!tail.empty() && !sink.write(tail.data(), tail.size()))
                return false;
              sink.done();
            }
            return true;
          });
      return;
    }

    res.set_content_provider(
        size, "application/octet-stream",
        [in](size_t offset, size_t length, httplib::DataSink &sink) {
          std::string buffer(std::min(length, kChunkSize), '\0');
          in->seekg(static_cast<std::streamoff>(offset));
          in->read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
          auto n = static_cast<size_t>(in->gcount());
          if (n == 0)
            return false;
          return sink.write(buffer.data(), n);
        });
  }
};

ServerApp::ServerApp(const ServerConfig &config,
                     std::shared_ptr<DatabaseManager> db)
    : m_impl(std::make_unique<Impl>(config, std::move(db))) {}

ServerApp::~ServerApp() = default;

bool ServerApp::listen(const std::string &host) {
  std::cout << "[Server] Serving on " << host << ":" << m_impl->config.port
            << std::endl;
  return m_impl->server.listen(host, m_impl->config.port);
}

int ServerApp::bindToAnyPort(const std::string &host) {
  return m_impl->server.bind_to_any_port(host);
}

bool ServerApp::listenAfterBind() { return m_impl->server.listen_after_bind(); }

void ServerApp::waitUntilReady() { m_impl->server.wait_until_ready(); }

void ServerApp::stop() { m_impl->server.stop(); }

} // namespace modsync
