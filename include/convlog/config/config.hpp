#pragma once

#include "convlog/common/result.hpp"
#include "convlog/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace convlog::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns non-fatal warnings, or a failure for values the library cannot run with.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// history.dir with ~ and $VARS expanded.
[[nodiscard]] std::filesystem::path resolved_history_dir(const Config &config);

} // namespace convlog::config
