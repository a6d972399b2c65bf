#pragma once

#include <cstdint>
#include <string>

namespace convlog::config {

struct HistoryConfig {
  std::string dir = "~/.convlog/conversations";
  std::string version = "1.0.0";
  std::string user_type = "external";
  // Empty means the process working directory at startup.
  std::string default_cwd;
};

struct CacheConfig {
  std::uint64_t ttl_seconds = 300;
};

struct DedupConfig {
  std::uint64_t window_ms = 5000;
};

struct RecoveryConfig {
  double compression_threshold = 0.8;
  double fallback_window_ratio = 0.8;
  std::uint64_t avg_tokens_per_message = 100;
  std::string token_estimator = "enhanced";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  HistoryConfig history;
  CacheConfig cache;
  DedupConfig dedup;
  RecoveryConfig recovery;
  ObservabilityConfig observability;
};

} // namespace convlog::config
