#pragma once

#include <string>
#include <string_view>

namespace sqlvault::util {

/*
  Streaming gzip codec over in-memory buffers (zlib, RFC 1952 framing).

  Output is deterministic for a given input: the header carries no mtime,
  so the same dump always compresses to the same bytes.
*/

std::string GzipCompress(std::string_view data);

// Throws IntegrityError on a corrupt or truncated stream.
std::string GzipDecompress(std::string_view data);

} // namespace sqlvault::util
