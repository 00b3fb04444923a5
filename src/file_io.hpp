#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pigame::io {

// Whole file contents, or nullopt when the file does not exist.
// Throws StorageError when the file exists but cannot be read.
std::optional<std::string> read_file(const std::filesystem::path& path);

// Writes to a sibling temporary file and renames it over `path`, so a
// failed write leaves the previous contents untouched. Creates the parent
// directory when missing. Throws StorageError.
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

} // namespace pigame::io
