#include "ApiClient.hpp"
#include "SyncError.hpp"
#include "httplib.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace modsync {

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

namespace {

void checkStatus(int status, const std::string &body,
                 const std::string &what) {
  if (status >= 200 && status < 300)
    return;
  if (status == 401)
    throw SyncError(ErrorKind::Authentication, "Invalid API key");
  if (status == 404)
    throw SyncError(ErrorKind::NotFound, what + ": not found");
  if (status == 400) {
    std::string code;
    try {
      code = json::parse(body).value("error", "");
    } catch (const json::exception &) {
    }
    if (code == "ALREADY_EXISTS")
      throw SyncError(ErrorKind::AlreadyExists, what + ": already exists");
    throw SyncError(ErrorKind::BadRequest, what + ": bad request " + body);
  }
  throw SyncError(ErrorKind::Transport,
                  what + ": server returned " + std::to_string(status) + " " +
                      body);
}

json checkResult(const httplib::Result &res, const std::string &what) {
  if (!res)
    throw SyncError(ErrorKind::Transport,
                    what + ": " + httplib::to_string(res.error()));
  checkStatus(res->status, res->body, what);
  try {
    return res->body.empty() ? json::object() : json::parse(res->body);
  } catch (const json::exception &e) {
    throw SyncError(ErrorKind::Transport,
                    what + ": malformed response: " + e.what());
  }
}

template <typename T> T decode(const json &j, const std::string &what) {
  try {
    return j.get<T>();
  } catch (const std::exception &e) {
    throw SyncError(ErrorKind::Transport,
                    what + ": unexpected response: " + e.what());
  }
}

} // namespace

struct ApiClient::Impl {
  httplib::Client client;
  Impl(const std::string &baseUrl, const std::string &apiKey)
      : client(baseUrl) {
    client.set_connection_timeout(30, 0);
    client.set_read_timeout(30, 0);
    client.set_write_timeout(30, 0);
    client.set_follow_location(true);
    client.set_keep_alive(true);
    client.set_bearer_token_auth(apiKey);
  }
};

ApiClient::ApiClient(const std::string &baseUrl, const std::string &apiKey)
    : m_impl(std::make_unique<Impl>(baseUrl, apiKey)), m_baseUrl(baseUrl) {}

ApiClient::~ApiClient() = default;

HelloResponse ApiClient::hello() {
  auto res = m_impl->client.Post("/hello");
  return decode<HelloResponse>(checkResult(res, "hello"), "hello");
}

std::string ApiClient::createModpack(const ModpackCreateBody &body) {
  json data = body;
  auto res = m_impl->client.Post("/modpack/create", data.dump(),
                                 "application/json");
  auto j = checkResult(res, "modpack " + body.name);
  return decode<std::string>(j.value("modpack_id", json()), "create");
}

ModpackResponse ApiClient::getModpack(const std::string &modpackId) {
  std::string path = "/modpack/" + urlEncode(modpackId);
  auto res = m_impl->client.Get(path);
  return decode<ModpackResponse>(checkResult(res, "modpack " + modpackId),
                                 "modpack " + modpackId);
}

void ApiClient::deleteModpack(const std::string &modpackId) {
  std::string path = "/modpack/" + urlEncode(modpackId) + "/delete";
  auto res = m_impl->client.Post(path);
  checkResult(res, "modpack " + modpackId);
}

void ApiClient::fileSync(const std::string &modpackId,
                         const FileSyncBody &body) {
  std::string path = "/modpack/" + urlEncode(modpackId) + "/filesync";
  json data = body;
  auto res = m_impl->client.Post(path, data.dump(), "application/json");
  checkResult(res, "filesync " + body.path);
}

FileUploadResponse ApiClient::uploadFile(const std::string &modpackId,
                                         const std::string &path,
                                         const std::string &absPath) {
  std::ifstream ifs(absPath, std::ios::binary);
  if (!ifs)
    throw SyncError(ErrorKind::Io, "unable to read " + absPath);

  std::string content((std::istreambuf_iterator<char>(ifs)),
                      (std::istreambuf_iterator<char>()));
  if (ifs.bad())
    throw SyncError(ErrorKind::Io, "read error on " + absPath);

  httplib::UploadFormDataItems items = {
      {"upload", content, "upload", "application/octet-stream"}};

  std::string query = "/modpack/" + urlEncode(modpackId) +
                      "/upload?file_path=" + urlEncode(path);
  auto res = m_impl->client.Post(query, items);
  return decode<FileUploadResponse>(checkResult(res, "upload " + path),
                                    "upload " + path);
}

void ApiClient::downloadFile(const std::string &hash,
                             const std::string &localAbsPath) {
  std::ofstream ofs(localAbsPath, std::ios::binary | std::ios::trunc);
  if (!ofs)
    throw SyncError(ErrorKind::Io, "cannot write " + localAbsPath);

  int status = 0;
  std::string errorBody;
  httplib::Headers headers = {{"Accept-Encoding", "gzip"}};

  auto res = m_impl->client.Get(
      "/dl/hash/" + urlEncode(hash), headers,
      [&](const httplib::Response &response) {
        status = response.status;
        return true;
      },
      [&](const char *data, size_t data_length) {
        if (status != 200) {
          errorBody.append(data, data_length);
          return true;
        }
        ofs.write(data, static_cast<std::streamsize>(data_length));
        return static_cast<bool>(ofs);
      });

  if (!ofs)
    throw SyncError(ErrorKind::Io, "write error on " + localAbsPath);
  if (!res)
    throw SyncError(ErrorKind::Transport,
                    "blob " + hash + ": " + httplib::to_string(res.error()));
  checkStatus(res->status, errorBody, "blob " + hash);

  ofs.close();
  if (!ofs)
    throw SyncError(ErrorKind::Io, "write error on " + localAbsPath);
}

} // namespace modsync
