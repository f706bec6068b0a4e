#include "file_io.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "internal/util/errors.hpp"

namespace sqlvault::util {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError("cannot open " + path.string());
  }

  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IoError("failed reading " + path.string());
  }
  return data;
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view data) {
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IoError("cannot open " + tmp_path.string() + " for writing");
    }

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();

    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw IoError("failed writing " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw IoError("failed to rename " + tmp_path.string() + ": " + ec.message());
  }
}

} // namespace sqlvault::util
