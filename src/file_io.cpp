#include "file_io.hpp"

#include "pigame/errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <unistd.h>

namespace pigame::io {

std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      throw StorageError("Cannot access " + path.string() + ": " + ec.message());
    }
    return std::nullopt;
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw StorageError("Failed to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw StorageError("Failed to read " + path.string());
  }
  return content;
}

void write_file_atomic(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw StorageError("Cannot create " + parent.string() + ": " + ec.message());
    }
  }

  auto tmp = path;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream stream(tmp, std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw StorageError("Failed to open " + tmp.string() + " for writing");
    }
    stream << content;
    stream.flush();
    if (!stream) {
      stream.close();
      std::filesystem::remove(tmp, ec);
      throw StorageError("Failed to write " + tmp.string());
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp, ec);
    throw StorageError("Failed to replace " + path.string() + ": " + reason);
  }
}

} // namespace pigame::io
