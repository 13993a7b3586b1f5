#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lineset {

// All functions throw StoreError(ErrorCode::IoError) on failure.
// Each call opens and closes its own handle.

// nullopt => the file does not exist. A directory at `p` is an error.
std::optional<std::string> read_file_if_exists(const std::filesystem::path& p);

void create_empty_file(const std::filesystem::path& p);

void ensure_parent_dirs(const std::filesystem::path& p);

// Opens for append (creating if absent). Writes '\n' before `line`
// when the file is non-empty. An unreadable size counts as empty.
void append_line(const std::filesystem::path& p, const std::string& line);

// Truncates and writes `content` in one go. Not crash-safe.
void write_file(const std::filesystem::path& p, const std::string& content);

} // namespace lineset
