#include "convlog/config/config.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/common/toml.hpp"
#include "convlog/observability/factory.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <vector>

namespace convlog::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".convlog";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CONVLOG_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}


} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure_from(cfg_dir);
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("CONVLOG_HISTORY_DIR"); dir != nullptr && *dir) {
    config.history.dir = dir;
  }

  if (const char *user_type = std::getenv("CONVLOG_USER_TYPE"); user_type != nullptr && *user_type) {
    config.history.user_type = common::to_lower(common::trim(user_type));
  }

  if (const char *ttl = std::getenv("CONVLOG_CACHE_TTL_SECONDS"); ttl != nullptr && *ttl) {
    const std::string value = common::trim(ttl);
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec == std::errc() && ptr == value.data() + value.size()) {
      config.cache.ttl_seconds = parsed;
    }
  }

  if (const char *backend = std::getenv("CONVLOG_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure_from(parsed);
  }
  const auto &doc = parsed.value();

  Config config;
  config.history.dir = doc.get_string("history.dir", config.history.dir);
  config.history.version = doc.get_string("history.version", config.history.version);
  config.history.user_type =
      common::to_lower(doc.get_string("history.user_type", config.history.user_type));
  config.history.default_cwd = doc.get_string("history.default_cwd", config.history.default_cwd);

  config.cache.ttl_seconds = doc.get_u64("cache.ttl_seconds", config.cache.ttl_seconds);
  config.dedup.window_ms = doc.get_u64("dedup.window_ms", config.dedup.window_ms);

  config.recovery.compression_threshold =
      doc.get_double("recovery.compression_threshold", config.recovery.compression_threshold);
  config.recovery.fallback_window_ratio =
      doc.get_double("recovery.fallback_window_ratio", config.recovery.fallback_window_ratio);
  config.recovery.avg_tokens_per_message =
      doc.get_u64("recovery.avg_tokens_per_message", config.recovery.avg_tokens_per_message);
  config.recovery.token_estimator = common::to_lower(
      doc.get_string("recovery.token_estimator", config.recovery.token_estimator));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::status_from(cfg_path_result);
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }

  std::ostringstream file;
  file << "[history]\n";
  file << "dir = " << common::quote_toml_string(config.history.dir) << "\n";
  file << "version = " << common::quote_toml_string(config.history.version) << "\n";
  file << "user_type = " << common::quote_toml_string(config.history.user_type) << "\n";
  file << "default_cwd = " << common::quote_toml_string(config.history.default_cwd) << "\n";

  file << "\n[cache]\n";
  file << "ttl_seconds = " << config.cache.ttl_seconds << "\n";

  file << "\n[dedup]\n";
  file << "window_ms = " << config.dedup.window_ms << "\n";

  file << "\n[recovery]\n";
  file << "compression_threshold = " << config.recovery.compression_threshold << "\n";
  file << "fallback_window_ratio = " << config.recovery.fallback_window_ratio << "\n";
  file << "avg_tokens_per_message = " << config.recovery.avg_tokens_per_message << "\n";
  file << "token_estimator = " << common::quote_toml_string(config.recovery.token_estimator)
       << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_text_file_atomic(path, file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.history.dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("history.dir must not be empty",
                                                             common::ErrorCode::InvalidArgument);
  }

  const std::string user_type = common::to_lower(config.history.user_type);
  if (user_type != "external" && user_type != "internal") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid history.user_type: " + config.history.user_type,
        common::ErrorCode::InvalidArgument);
  }

  if (!(config.recovery.compression_threshold > 0.0 &&
        config.recovery.compression_threshold <= 1.0)) {
    return common::Result<std::vector<std::string>>::failure(
        "recovery.compression_threshold must be in (0, 1]", common::ErrorCode::InvalidArgument);
  }
  if (!(config.recovery.fallback_window_ratio > 0.0 &&
        config.recovery.fallback_window_ratio <= 1.0)) {
    return common::Result<std::vector<std::string>>::failure(
        "recovery.fallback_window_ratio must be in (0, 1]", common::ErrorCode::InvalidArgument);
  }
  if (config.recovery.avg_tokens_per_message == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "recovery.avg_tokens_per_message must be positive", common::ErrorCode::InvalidArgument);
  }
  const std::string estimator = common::to_lower(config.recovery.token_estimator);
  if (estimator != "simple" && estimator != "enhanced") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid recovery.token_estimator: " + config.recovery.token_estimator,
        common::ErrorCode::InvalidArgument);
  }

  if (auto backends = observability::parse_backends(config.observability.backend);
      !backends.ok()) {
    return common::Result<std::vector<std::string>>::failure_from(backends);
  }

  if (config.cache.ttl_seconds == 0) {
    warnings.emplace_back("cache.ttl_seconds is 0; every read goes to disk");
  }
  if (config.dedup.window_ms == 0) {
    warnings.emplace_back("dedup.window_ms is 0; only identical uuids are treated as duplicates");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::filesystem::path resolved_history_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.history.dir));
}

} // namespace convlog::config
