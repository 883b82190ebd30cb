#pragma once

#include <stdexcept>
#include <string>

namespace modsync {

enum class ErrorKind {
  Authentication,
  NotFound,
  AlreadyExists,
  BadRequest,
  Transport,
  Io,
  Database,
  Encoding,
  CorruptState,
  Config
};

/**
 * SyncError is thrown by every modsync component. The kind decides how far
 * the failure travels: per-file NotFound is absorbed by the download pass,
 * everything else aborts the current run.
 */
class SyncError : public std::runtime_error {
public:
  SyncError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), m_kind(kind) {}

  ErrorKind kind() const { return m_kind; }

private:
  ErrorKind m_kind;
};

// Wire code used in server error bodies, e.g. "NOT_FOUND"
std::string errorCode(ErrorKind kind);

} // namespace modsync
