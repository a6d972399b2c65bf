#pragma once

#include "convlog/common/result.hpp"
#include <filesystem>
#include <string>

namespace convlog::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file. Missing files fail with ErrorCode::NotFound.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Write a file through a sibling ".tmp" file and rename it into place.
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);

/// Append one line (a trailing newline is added) to an existing or new file.
[[nodiscard]] Status append_line(const std::filesystem::path &path, const std::string &line);

} // namespace convlog::common
