#include "convlog/history/metadata.hpp"

#include "convlog/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace convlog::history {

namespace {

using common::json_quote;

std::optional<std::size_t> parse_count(const std::string &raw) {
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return value;
}

std::string quote_or_null(const std::optional<std::string> &value) {
  return value.has_value() ? json_quote(*value) : "null";
}

} // namespace

void apply_metadata_patch(SessionMetadata &metadata, const MetadataPatch &patch) {
  if (patch.title.has_value()) {
    metadata.title = *patch.title;
  }
  if (patch.cwd.has_value()) {
    metadata.cwd = *patch.cwd;
  }
  if (patch.summary.has_value()) {
    metadata.summary = *patch.summary;
  }
}

std::string encode_metadata_json(const SessionMetadata &metadata) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"sessionId\": " << json_quote(metadata.session_id) << ",\n";
  out << "  \"title\": " << json_quote(metadata.title) << ",\n";
  out << "  \"created\": " << json_quote(metadata.created) << ",\n";
  out << "  \"updated\": " << json_quote(metadata.updated) << ",\n";
  out << "  \"messageCount\": " << metadata.message_count << ",\n";
  out << "  \"cwd\": " << json_quote(metadata.cwd) << ",\n";
  out << "  \"version\": " << json_quote(metadata.version) << ",\n";
  out << "  \"userType\": " << json_quote(metadata.user_type) << ",\n";
  out << "  \"hasSummary\": " << (metadata.has_summary ? "true" : "false");
  if (metadata.has_summary || metadata.last_summary_uuid.has_value()) {
    out << ",\n  \"lastSummaryUuid\": " << quote_or_null(metadata.last_summary_uuid);
    out << ",\n  \"lastSummaryTime\": " << quote_or_null(metadata.last_summary_time);
    out << ",\n  \"lastSummaryIndex\": ";
    if (metadata.last_summary_index.has_value()) {
      out << *metadata.last_summary_index;
    } else {
      out << "null";
    }
  }
  if (metadata.summary.has_value()) {
    out << ",\n  \"summary\": " << json_quote(*metadata.summary);
  }
  out << "\n}\n";
  return out.str();
}

common::Result<SessionMetadata> parse_metadata_json(const std::string &json) {
  const auto members = common::json_object_members(json);
  if (!members.has_value()) {
    return common::Result<SessionMetadata>::failure("metadata is not a JSON object",
                                                    common::ErrorCode::Parse);
  }

  SessionMetadata metadata;
  for (const auto &[key, raw] : *members) {
    const auto text = common::json_string_value(raw);
    if (key == "sessionId" && text.has_value()) {
      metadata.session_id = *text;
    } else if (key == "title" && text.has_value()) {
      metadata.title = *text;
    } else if (key == "created" && text.has_value()) {
      metadata.created = *text;
    } else if (key == "updated" && text.has_value()) {
      metadata.updated = *text;
    } else if (key == "cwd" && text.has_value()) {
      metadata.cwd = *text;
    } else if (key == "version" && text.has_value()) {
      metadata.version = *text;
    } else if (key == "userType" && text.has_value()) {
      metadata.user_type = *text;
    } else if (key == "summary" && text.has_value()) {
      metadata.summary = *text;
    } else if (key == "messageCount") {
      const auto count = parse_count(raw);
      if (!count.has_value()) {
        return common::Result<SessionMetadata>::failure("messageCount must be a count",
                                                        common::ErrorCode::Parse);
      }
      metadata.message_count = *count;
    } else if (key == "hasSummary") {
      metadata.has_summary = raw == "true";
    } else if (key == "lastSummaryUuid" && text.has_value()) {
      metadata.last_summary_uuid = *text;
    } else if (key == "lastSummaryTime" && text.has_value()) {
      metadata.last_summary_time = *text;
    } else if (key == "lastSummaryIndex") {
      metadata.last_summary_index = parse_count(raw);
    }
  }

  if (metadata.session_id.empty()) {
    return common::Result<SessionMetadata>::failure("metadata sessionId missing",
                                                    common::ErrorCode::Parse);
  }
  // hasSummary follows the pointer when a file carries only the uuid.
  if (metadata.last_summary_uuid.has_value()) {
    metadata.has_summary = true;
  }
  return common::Result<SessionMetadata>::success(std::move(metadata));
}

} // namespace convlog::history
