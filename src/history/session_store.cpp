#include "convlog/history/session_store.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/common/time.hpp"
#include "convlog/common/uuid.hpp"
#include "convlog/observability/global.hpp"

#include <algorithm>
#include <fstream>

namespace convlog::history {

namespace {

constexpr const char *LOG_FILENAME = "messages.jsonl";
constexpr const char *METADATA_FILENAME = "metadata.json";
constexpr const char *COMPONENT = "history.store";

bool is_session_id_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '-' || ch == '_';
}

void set_summary_pointer(SessionMetadata &metadata,
                         const std::vector<ConversationMessage> &messages) {
  metadata.has_summary = false;
  metadata.last_summary_uuid.reset();
  metadata.last_summary_time.reset();
  metadata.last_summary_index.reset();
  for (std::size_t i = messages.size(); i > 0; --i) {
    const auto &message = messages[i - 1];
    if (is_summary_message(message)) {
      metadata.has_summary = true;
      metadata.last_summary_uuid = message.uuid;
      metadata.last_summary_time = message.timestamp;
      metadata.last_summary_index = i - 1;
      return;
    }
  }
}

} // namespace

SessionStore::SessionStore(std::filesystem::path root_dir, SessionDefaults defaults)
    : root_dir_(std::move(root_dir)), defaults_(std::move(defaults)) {}

common::Status SessionStore::validate_session_id(const std::string &session_id) {
  if (session_id.empty()) {
    return common::Status::error("session id is required", common::ErrorCode::InvalidArgument);
  }
  if (!std::all_of(session_id.begin(), session_id.end(), is_session_id_char)) {
    return common::Status::error("invalid session id: " + session_id,
                                 common::ErrorCode::InvalidArgument);
  }
  return common::Status::success();
}

std::filesystem::path SessionStore::session_dir(const std::string &session_id) const {
  return root_dir_ / session_id;
}

std::filesystem::path SessionStore::log_path(const std::string &session_id) const {
  return session_dir(session_id) / LOG_FILENAME;
}

std::filesystem::path SessionStore::metadata_path(const std::string &session_id) const {
  return session_dir(session_id) / METADATA_FILENAME;
}

bool SessionStore::session_exists(const std::string &session_id) const {
  if (!validate_session_id(session_id).ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_directory(session_dir(session_id), ec);
}

common::Status SessionStore::require_session(const std::string &session_id) const {
  if (auto valid = validate_session_id(session_id); !valid.ok()) {
    return valid;
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(session_dir(session_id), ec)) {
    return common::Status::error("session not found: " + session_id,
                                 common::ErrorCode::NotFound);
  }
  return common::Status::success();
}

SessionMetadata SessionStore::default_metadata(const std::string &session_id,
                                               const std::optional<std::string> &title) const {
  const auto now = std::chrono::system_clock::now();
  const std::string stamp = common::format_iso8601(now);

  SessionMetadata metadata;
  metadata.session_id = session_id;
  metadata.title = title.has_value() && !common::trim(*title).empty()
                       ? *title
                       : "Session " + common::local_datetime_label(now);
  metadata.created = stamp;
  metadata.updated = stamp;
  metadata.cwd = defaults_.cwd;
  metadata.version = defaults_.version;
  metadata.user_type = defaults_.user_type;
  return metadata;
}

common::Status SessionStore::write_metadata(const SessionMetadata &metadata) const {
  return common::write_text_file_atomic(metadata_path(metadata.session_id),
                                        encode_metadata_json(metadata));
}

common::Result<std::string> SessionStore::create_session(const std::optional<std::string> &title) {
  auto created = create_session_with_id(common::generate_uuid(), title);
  if (!created.ok()) {
    return common::Result<std::string>::failure_from(created);
  }
  return common::Result<std::string>::success(created.value().session_id);
}

common::Result<SessionMetadata>
SessionStore::create_session_with_id(const std::string &session_id,
                                     const std::optional<std::string> &title) {
  if (auto valid = validate_session_id(session_id); !valid.ok()) {
    return common::Result<SessionMetadata>::failure_from(valid);
  }
  if (session_exists(session_id)) {
    return common::Result<SessionMetadata>::failure("session already exists: " + session_id,
                                                    common::ErrorCode::InvalidArgument);
  }

  if (auto dir = common::ensure_dir(session_dir(session_id)); !dir.ok()) {
    return common::Result<SessionMetadata>::failure_from(dir);
  }
  if (auto log = common::write_text_file_atomic(log_path(session_id), ""); !log.ok()) {
    return common::Result<SessionMetadata>::failure_from(log);
  }

  SessionMetadata metadata = default_metadata(session_id, title);
  if (auto written = write_metadata(metadata); !written.ok()) {
    return common::Result<SessionMetadata>::failure_from(written);
  }
  observability::record_session("create", session_id);
  return common::Result<SessionMetadata>::success(std::move(metadata));
}

common::Result<std::vector<ConversationMessage>>
SessionStore::load_session(const std::string &session_id) const {
  if (auto exists = require_session(session_id); !exists.ok()) {
    return common::Result<std::vector<ConversationMessage>>::failure_from(exists);
  }

  std::vector<ConversationMessage> messages;
  std::ifstream in(log_path(session_id), std::ios::binary);
  if (!in) {
    // A session directory without a log has no messages yet.
    return common::Result<std::vector<ConversationMessage>>::success(std::move(messages));
  }

  std::size_t line_number = 0;
  std::size_t skipped = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_number;
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_message_jsonl(line);
    if (!parsed.ok()) {
      ++skipped;
      observability::record_warning(COMPONENT, "skipping malformed line " +
                                                   std::to_string(line_number) + " in " +
                                                   session_id + ": " + parsed.error());
      continue;
    }
    messages.push_back(std::move(parsed.value()));
  }
  if (in.bad()) {
    return common::Result<std::vector<ConversationMessage>>::failure(
        "failed reading log for session " + session_id);
  }

  observability::record_metric(
      observability::LogLoadMetric{.lines = line_number, .skipped = skipped});
  return common::Result<std::vector<ConversationMessage>>::success(std::move(messages));
}

common::Status SessionStore::save_session(const std::string &session_id,
                                          const std::vector<ConversationMessage> &messages) {
  if (auto valid = validate_session_id(session_id); !valid.ok()) {
    return valid;
  }
  if (auto dir = common::ensure_dir(session_dir(session_id)); !dir.ok()) {
    return common::status_from(dir);
  }

  std::string content;
  for (const auto &message : messages) {
    content += encode_message_jsonl(message);
    content += "\n";
  }
  if (auto written = common::write_text_file_atomic(log_path(session_id), content);
      !written.ok()) {
    return written;
  }

  SessionMetadata metadata;
  if (auto existing = load_metadata(session_id); existing.ok()) {
    metadata = std::move(existing.value());
  } else {
    metadata = default_metadata(session_id, std::nullopt);
  }
  metadata.updated = common::now_iso8601();
  metadata.message_count = messages.size();
  set_summary_pointer(metadata, messages);
  return write_metadata(metadata);
}

common::Status SessionStore::append_message(const std::string &session_id,
                                            const ConversationMessage &message) {
  if (auto exists = require_session(session_id); !exists.ok()) {
    return exists;
  }
  return common::append_line(log_path(session_id), encode_message_jsonl(message));
}

common::Status SessionStore::delete_session(const std::string &session_id) {
  if (auto valid = validate_session_id(session_id); !valid.ok()) {
    return valid;
  }
  std::error_code ec;
  if (!std::filesystem::exists(session_dir(session_id), ec)) {
    return common::Status::success();
  }
  std::filesystem::remove_all(session_dir(session_id), ec);
  if (ec) {
    return common::Status::error("failed deleting session " + session_id + ": " + ec.message());
  }
  observability::record_session("delete", session_id);
  return common::Status::success();
}

common::Result<std::vector<SessionMetadata>> SessionStore::list_sessions() const {
  std::vector<SessionMetadata> sessions;
  std::error_code ec;
  if (!std::filesystem::is_directory(root_dir_, ec)) {
    return common::Result<std::vector<SessionMetadata>>::success(std::move(sessions));
  }

  std::filesystem::directory_iterator it(root_dir_, ec);
  if (ec) {
    return common::Result<std::vector<SessionMetadata>>::failure(
        "failed listing " + root_dir_.string() + ": " + ec.message());
  }
  for (const auto &entry : it) {
    std::error_code entry_ec;
    if (!entry.is_directory(entry_ec)) {
      continue;
    }
    const std::string session_id = entry.path().filename().string();
    auto metadata = load_metadata(session_id);
    if (!metadata.ok()) {
      observability::record_warning(COMPONENT, "skipping session " + session_id + ": " +
                                                   metadata.error());
      continue;
    }
    sessions.push_back(std::move(metadata.value()));
  }

  std::sort(sessions.begin(), sessions.end(),
            [](const SessionMetadata &a, const SessionMetadata &b) { return a.updated > b.updated; });
  return common::Result<std::vector<SessionMetadata>>::success(std::move(sessions));
}

common::Result<SessionMetadata> SessionStore::load_metadata(const std::string &session_id) const {
  if (auto exists = require_session(session_id); !exists.ok()) {
    return common::Result<SessionMetadata>::failure_from(exists);
  }
  auto content = common::read_text_file(metadata_path(session_id));
  if (!content.ok()) {
    return common::Result<SessionMetadata>::failure_from(content);
  }
  return parse_metadata_json(content.value());
}

common::Result<SessionMetadata> SessionStore::update_metadata(const std::string &session_id,
                                                              const MetadataPatch &patch) {
  return modify_metadata(session_id, [&patch](SessionMetadata &metadata) {
    apply_metadata_patch(metadata, patch);
    metadata.updated = common::now_iso8601();
  });
}

common::Result<SessionMetadata>
SessionStore::modify_metadata(const std::string &session_id,
                              const std::function<void(SessionMetadata &)> &mutator) {
  if (auto exists = require_session(session_id); !exists.ok()) {
    return common::Result<SessionMetadata>::failure_from(exists);
  }

  SessionMetadata metadata;
  if (auto existing = load_metadata(session_id); existing.ok()) {
    metadata = std::move(existing.value());
  } else {
    observability::record_warning(COMPONENT, "metadata unreadable for " + session_id +
                                                 ", starting from defaults: " + existing.error());
    metadata = default_metadata(session_id, std::nullopt);
  }

  mutator(metadata);
  metadata.session_id = session_id;
  if (auto written = write_metadata(metadata); !written.ok()) {
    return common::Result<SessionMetadata>::failure_from(written);
  }
  return common::Result<SessionMetadata>::success(std::move(metadata));
}

common::Result<LogSuffix> SessionStore::read_log_from(const std::string &session_id,
                                                      const std::string &uuid) const {
  if (auto exists = require_session(session_id); !exists.ok()) {
    return common::Result<LogSuffix>::failure_from(exists);
  }

  LogSuffix suffix;
  std::ifstream in(log_path(session_id), std::ios::binary);
  if (!in || uuid.empty()) {
    return common::Result<LogSuffix>::success(std::move(suffix));
  }

  std::size_t line_number = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_number;
    // Lines before the anchor are only parsed when they mention its uuid.
    if (!suffix.found && line.find(uuid) == std::string::npos) {
      continue;
    }
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_message_jsonl(line);
    if (!parsed.ok()) {
      if (suffix.found) {
        observability::record_warning(COMPONENT, "skipping malformed line " +
                                                     std::to_string(line_number) + " in " +
                                                     session_id + ": " + parsed.error());
      }
      continue;
    }
    if (!suffix.found) {
      if (parsed.value().uuid != uuid) {
        continue;
      }
      suffix.found = true;
    }
    suffix.messages.push_back(std::move(parsed.value()));
  }
  if (in.bad()) {
    return common::Result<LogSuffix>::failure("failed reading log for session " + session_id);
  }
  return common::Result<LogSuffix>::success(std::move(suffix));
}

} // namespace convlog::history
