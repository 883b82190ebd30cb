#pragma once

#include <memory>
#include <string>

namespace modsync {

// Incremental gzip encoder over zlib's deflate
class GzipStream {
public:
  GzipStream();
  ~GzipStream();
  GzipStream(const GzipStream &) = delete;
  GzipStream &operator=(const GzipStream &) = delete;

  // Compresses a chunk; returns whatever output zlib produced so far
  std::string write(const char *data, size_t size);
  // Flushes the trailer; the stream cannot be written afterwards
  std::string finish();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace modsync
