#pragma once

#include "convlog/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace convlog::history {

struct SessionMetadata {
  std::string session_id;
  std::string title;
  std::string created;
  std::string updated;
  std::size_t message_count = 0;
  std::string cwd;
  std::string version;
  std::string user_type = "external";
  bool has_summary = false;
  std::optional<std::string> last_summary_uuid;
  std::optional<std::string> last_summary_time;
  std::optional<std::size_t> last_summary_index;
  std::optional<std::string> summary;
};

/// Fields a caller may change directly. Counters and the summary pointer are owned by the manager.
struct MetadataPatch {
  std::optional<std::string> title;
  std::optional<std::string> cwd;
  std::optional<std::string> summary;
};

void apply_metadata_patch(SessionMetadata &metadata, const MetadataPatch &patch);

/// Pretty-printed with two-space indentation, newline terminated.
[[nodiscard]] std::string encode_metadata_json(const SessionMetadata &metadata);
[[nodiscard]] common::Result<SessionMetadata> parse_metadata_json(const std::string &json);

} // namespace convlog::history
