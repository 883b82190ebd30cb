#include "GzipStream.hpp"
#include "SyncError.hpp"
#include <zlib.h>

namespace modsync {

struct GzipStream::Impl {
  z_stream strm{};
  bool finished = false;

  std::string run(const char *data, size_t size, int flush) {
    std::string out;
    strm.next_in = reinterpret_cast<const Bytef *>(data);
    strm.avail_in = static_cast<uInt>(size);
    char buffer[16384];
    int ret;
    do {
      strm.next_out = reinterpret_cast<Bytef *>(buffer);
      strm.avail_out = sizeof(buffer);
      ret = deflate(&strm, flush);
      if (ret == Z_STREAM_ERROR)
        throw SyncError(ErrorKind::Io, "gzip stream error");
      out.append(buffer, sizeof(buffer) - strm.avail_out);
    } while (strm.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
    return out;
  }
};

GzipStream::GzipStream() : m_impl(std::make_unique<Impl>()) {
  // 15 window bits + 16 selects the gzip wrapper
  if (deflateInit2(&m_impl->strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16,
                   8, Z_DEFAULT_STRATEGY) != Z_OK)
    throw SyncError(ErrorKind::Io, "gzip init failed");
}

GzipStream::~GzipStream() { deflateEnd(&m_impl->strm); }

std::string GzipStream::write(const char *data, size_t size) {
  if (m_impl->finished)
    throw SyncError(ErrorKind::Io, "gzip stream already finished");
  return m_impl->run(data, size, Z_NO_FLUSH);
}

std::string GzipStream::finish() {
  if (m_impl->finished)
    return {};
  m_impl->finished = true;
  return m_impl->run(nullptr, 0, Z_FINISH);
}

} // namespace modsync
