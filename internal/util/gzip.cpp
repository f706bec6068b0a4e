#include "gzip.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sqlvault::util {

namespace {

// 15 bits of window plus 16 selects the gzip wrapper.
constexpr int    kGzipWindowBits = 15 + 16;
constexpr int    kMemLevel       = 8;
constexpr size_t kChunkSize      = 16 * 1024;

std::string ZlibMessage(const z_stream& stream, int rc) {
  if (stream.msg) return stream.msg;
  return "zlib error " + std::to_string(rc);
}

} // namespace

std::string GzipCompress(std::string_view data) {
  z_stream stream{};
  int      rc = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error("gzip compress init failed: " + ZlibMessage(stream, rc));
  }

  std::string                   out;
  std::array<Bytef, kChunkSize> chunk;
  size_t                        offset = 0;
  int                           flush  = Z_NO_FLUSH;

  do {
    const size_t remaining = data.size() - offset;
    const size_t feed      = std::min<size_t>(remaining, std::numeric_limits<uInt>::max());
    stream.next_in         = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + offset));
    stream.avail_in        = static_cast<uInt>(feed);
    offset += feed;
    flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;

    do {
      stream.next_out  = chunk.data();
      stream.avail_out = static_cast<uInt>(chunk.size());
      rc               = deflate(&stream, flush);
      if (rc == Z_STREAM_ERROR) {
        deflateEnd(&stream);
        throw std::runtime_error("gzip compress failed: " + ZlibMessage(stream, rc));
      }
      out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - stream.avail_out);
    } while (stream.avail_out == 0);
  } while (flush != Z_FINISH);

  deflateEnd(&stream);
  return out;
}

std::string GzipDecompress(std::string_view data) {
  z_stream stream{};
  int      rc = inflateInit2(&stream, kGzipWindowBits);
  if (rc != Z_OK) {
    throw std::runtime_error("gzip decompress init failed: " + ZlibMessage(stream, rc));
  }

  std::string                   out;
  std::array<Bytef, kChunkSize> chunk;
  size_t                        offset = 0;

  do {
    const size_t remaining = data.size() - offset;
    const size_t feed      = std::min<size_t>(remaining, std::numeric_limits<uInt>::max());
    stream.next_in         = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + offset));
    stream.avail_in        = static_cast<uInt>(feed);
    offset += feed;

    do {
      stream.next_out  = chunk.data();
      stream.avail_out = static_cast<uInt>(chunk.size());
      rc               = inflate(&stream, Z_NO_FLUSH);
      if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
        const auto message = ZlibMessage(stream, rc);
        inflateEnd(&stream);
        throw IntegrityError("gzip stream is corrupt: " + message);
      }
      out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - stream.avail_out);
    } while (stream.avail_out == 0 && rc != Z_STREAM_END);
  } while (rc != Z_STREAM_END && offset < data.size());

  const bool trailing = stream.avail_in != 0 || offset != data.size();
  inflateEnd(&stream);

  if (rc != Z_STREAM_END) {
    throw IntegrityError("gzip stream is truncated");
  }
  if (trailing) {
    throw IntegrityError("trailing bytes after gzip stream");
  }
  return out;
}

} // namespace sqlvault::util
