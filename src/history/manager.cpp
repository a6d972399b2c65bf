#include "convlog/history/manager.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/common/time.hpp"
#include "convlog/common/uuid.hpp"
#include "convlog/config/config.hpp"
#include "convlog/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace convlog::history {

namespace {

constexpr const char *COMPONENT = "history.manager";

std::string summary_content(const std::string &content) {
  if (common::starts_with(content, std::string(SUMMARY_MARKER))) {
    return content;
  }
  return std::string(SUMMARY_MARKER) + "\n" + content;
}

} // namespace

HistoryOptions history_options_from_config(const config::Config &config) {
  HistoryOptions options;
  options.root_dir = config::resolved_history_dir(config);
  options.version = config.history.version;
  options.user_type =
      user_type_from_string(config.history.user_type).value_or(UserType::External);
  options.cwd = config.history.default_cwd;
  if (options.cwd.empty()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
      options.cwd = cwd.string();
    }
  }
  options.cache_ttl = std::chrono::seconds(config.cache.ttl_seconds);
  options.dedup_window = std::chrono::milliseconds(config.dedup.window_ms);
  return options;
}

ConversationHistoryManager::ConversationHistoryManager(HistoryOptions options,
                                                       MessageCache::Clock clock)
    : options_(std::move(options)),
      store_(options_.root_dir, SessionDefaults{.version = options_.version,
                                                .user_type = user_type_to_string(options_.user_type),
                                                .cwd = options_.cwd}),
      cache_(options_.cache_ttl, std::move(clock)) {}

ConversationMessage
ConversationHistoryManager::create_message(const MessageType type, const std::string &content,
                                           const std::optional<std::string> &parent_uuid,
                                           const std::string &session_id) const {
  ConversationMessage message;
  message.uuid = common::generate_uuid();
  message.parent_uuid = parent_uuid;
  message.session_id = session_id;
  message.type = type;
  message.message.role = message_type_to_string(type);
  message.message.content = content;
  message.timestamp = common::now_iso8601();
  message.cwd = options_.cwd;
  message.user_type = options_.user_type;
  message.version = options_.version;
  return message;
}

ConversationMessage
ConversationHistoryManager::make_summary_message(const std::string &session_id,
                                                 const std::string &content,
                                                 const std::optional<std::string> &parent_uuid) const {
  ConversationMessage message =
      create_message(MessageType::Assistant, summary_content(content), parent_uuid, session_id);
  message.is_summary = true;
  return message;
}

common::Result<std::string>
ConversationHistoryManager::create_session(const std::optional<std::string> &title) {
  auto created = store_.create_session(title);
  if (created.ok()) {
    cache_.set_messages(created.value(), {});
  }
  return created;
}

common::Result<SessionMetadata>
ConversationHistoryManager::create_session_with_id(const std::string &session_id,
                                                   const std::optional<std::string> &title) {
  auto created = store_.create_session_with_id(session_id, title);
  if (created.ok()) {
    cache_.set_messages(session_id, {});
    cache_.set_metadata(session_id, created.value());
  }
  return created;
}

std::shared_ptr<std::mutex>
ConversationHistoryManager::session_mutex(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto &entry = session_locks_[session_id];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

common::Result<std::vector<ConversationMessage>>
ConversationHistoryManager::cached_messages(const std::string &session_id) {
  if (auto cached = cache_.get_messages(session_id); cached.has_value()) {
    return common::Result<std::vector<ConversationMessage>>::success(std::move(*cached));
  }
  auto loaded = store_.load_session(session_id);
  if (loaded.ok()) {
    cache_.set_messages(session_id, loaded.value());
  }
  return loaded;
}

common::Status ConversationHistoryManager::append_locked(const std::string &session_id,
                                                         const ConversationMessage &message) {
  if (auto appended = store_.append_message(session_id, message); !appended.ok()) {
    cache_.invalidate(session_id);
    observability::record_error(COMPONENT,
                                "append failed for " + session_id + ": " + appended.error());
    return appended;
  }
  cache_.append_message(session_id, message);

  const bool summary = is_summary_message(message);
  auto metadata = store_.modify_metadata(session_id, [&](SessionMetadata &meta) {
    const std::size_t index = meta.message_count;
    meta.message_count += 1;
    meta.updated = common::now_iso8601();
    if (summary) {
      meta.has_summary = true;
      meta.last_summary_uuid = message.uuid;
      meta.last_summary_time = message.timestamp.empty() ? meta.updated : message.timestamp;
      meta.last_summary_index = index;
    }
  });
  if (!metadata.ok()) {
    cache_.invalidate(session_id);
    observability::record_error(COMPONENT, "metadata update failed for " + session_id + ": " +
                                               metadata.error());
    return common::status_from(metadata);
  }
  cache_.set_metadata(session_id, metadata.value());

  observability::record_message_appended(session_id, message.uuid,
                                         message_type_to_string(message.type), summary);
  return common::Status::success();
}

common::Status ConversationHistoryManager::add_message(const std::string &session_id,
                                                       const ConversationMessage &message) {
  if (message.uuid.empty()) {
    return common::Status::error("message uuid is required", common::ErrorCode::InvalidArgument);
  }
  if (!message.session_id.empty() && message.session_id != session_id) {
    return common::Status::error("message belongs to session " + message.session_id,
                                 common::ErrorCode::InvalidArgument);
  }
  if (auto raw = validate_raw_json(message); !raw.ok()) {
    return raw;
  }

  ConversationMessage stored = message;
  stored.session_id = session_id;

  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  return append_locked(session_id, stored);
}

bool ConversationHistoryManager::is_duplicate(const ConversationMessage &existing,
                                              const ConversationMessage &incoming) const {
  if (existing.uuid == incoming.uuid) {
    return true;
  }
  if (existing.type != incoming.type || existing.message.content != incoming.message.content ||
      existing.message.raw_content != incoming.message.raw_content) {
    return false;
  }

  const auto existing_time = common::parse_iso8601(existing.timestamp);
  const auto incoming_time = common::parse_iso8601(incoming.timestamp);
  if (!existing_time.has_value() || !incoming_time.has_value()) {
    return false;
  }
  const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(
      *incoming_time > *existing_time ? *incoming_time - *existing_time
                                      : *existing_time - *incoming_time);
  return delta < options_.dedup_window;
}

common::Result<DedupOutcome>
ConversationHistoryManager::add_message_with_deduplication(const std::string &session_id,
                                                           const ConversationMessage &message) {
  if (message.uuid.empty()) {
    return common::Result<DedupOutcome>::failure("message uuid is required",
                                                 common::ErrorCode::InvalidArgument);
  }
  if (!message.session_id.empty() && message.session_id != session_id) {
    return common::Result<DedupOutcome>::failure("message belongs to session " +
                                                     message.session_id,
                                                 common::ErrorCode::InvalidArgument);
  }
  if (auto raw = validate_raw_json(message); !raw.ok()) {
    return common::Result<DedupOutcome>::failure_from(raw);
  }

  ConversationMessage stored = message;
  stored.session_id = session_id;

  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);

  auto existing = cached_messages(session_id);
  if (!existing.ok()) {
    return common::Result<DedupOutcome>::failure_from(existing);
  }
  const auto &messages = existing.value();
  const auto duplicate =
      std::find_if(messages.rbegin(), messages.rend(), [&](const ConversationMessage &candidate) {
        return is_duplicate(candidate, stored);
      });
  if (duplicate != messages.rend()) {
    observability::record_duplicate(session_id, stored.uuid, message_type_to_string(stored.type),
                                    stored.message.content);
    return common::Result<DedupOutcome>::success(
        DedupOutcome{.appended = false, .uuid = duplicate->uuid});
  }

  if (auto appended = append_locked(session_id, stored); !appended.ok()) {
    return common::Result<DedupOutcome>::failure_from(appended);
  }
  return common::Result<DedupOutcome>::success(
      DedupOutcome{.appended = true, .uuid = stored.uuid});
}

common::Result<std::vector<SessionMetadata>> ConversationHistoryManager::list_sessions() const {
  return store_.list_sessions();
}

common::Status ConversationHistoryManager::delete_session(const std::string &session_id) {
  if (auto valid = SessionStore::validate_session_id(session_id); !valid.ok()) {
    return valid;
  }
  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  cache_.invalidate(session_id);
  auto deleted = store_.delete_session(session_id);
  if (deleted.ok()) {
    // Callers already holding this mutex keep it alive through their shared_ptr.
    std::lock_guard<std::mutex> locks(locks_mutex_);
    session_locks_.erase(session_id);
  }
  return deleted;
}

std::size_t ConversationHistoryManager::session_lock_count() const {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  return session_locks_.size();
}

common::Status ConversationHistoryManager::update_session_title(const std::string &session_id,
                                                                const std::string &title) {
  return update_metadata(session_id, MetadataPatch{.title = title});
}

common::Status ConversationHistoryManager::update_metadata(const std::string &session_id,
                                                           const MetadataPatch &patch) {
  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  auto updated = store_.update_metadata(session_id, patch);
  if (!updated.ok()) {
    cache_.invalidate(session_id);
    return common::status_from(updated);
  }
  cache_.set_metadata(session_id, updated.value());
  return common::Status::success();
}

common::Result<std::vector<ConversationMessage>>
ConversationHistoryManager::get_messages(const std::string &session_id) {
  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  return cached_messages(session_id);
}

common::Result<std::vector<ConversationMessage>>
ConversationHistoryManager::load_session(const std::string &session_id) {
  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  auto loaded = store_.load_session(session_id);
  if (loaded.ok()) {
    cache_.set_messages(session_id, loaded.value());
  } else {
    cache_.invalidate(session_id);
  }
  return loaded;
}

common::Status
ConversationHistoryManager::save_session(const std::string &session_id,
                                         const std::vector<ConversationMessage> &messages) {
  for (const auto &message : messages) {
    if (auto raw = validate_raw_json(message); !raw.ok()) {
      return common::Status::error("message " + message.uuid + ": " + raw.error(), raw.code());
    }
  }

  const auto mutex = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*mutex);
  cache_.invalidate(session_id);
  auto saved = store_.save_session(session_id, messages);
  if (!saved.ok()) {
    observability::record_error(COMPONENT,
                                "save failed for " + session_id + ": " + saved.error());
    return saved;
  }
  cache_.set_messages(session_id, messages);
  observability::record_session("save", session_id);
  return saved;
}

common::Result<SessionMetadata>
ConversationHistoryManager::get_metadata(const std::string &session_id) {
  if (auto cached = cache_.get_metadata(session_id); cached.has_value()) {
    return common::Result<SessionMetadata>::success(std::move(*cached));
  }
  auto loaded = store_.load_metadata(session_id);
  if (loaded.ok()) {
    cache_.set_metadata(session_id, loaded.value());
  }
  return loaded;
}

common::Result<std::string>
ConversationHistoryManager::resolve_session_id(const std::string &query) const {
  const std::string needle = common::trim(query);
  if (needle.empty()) {
    return common::Result<std::string>::failure("session query is empty",
                                                common::ErrorCode::InvalidArgument);
  }

  auto sessions = store_.list_sessions();
  if (!sessions.ok()) {
    return common::Result<std::string>::failure_from(sessions);
  }

  std::vector<std::string> prefix_matches;
  for (const auto &session : sessions.value()) {
    if (session.session_id == needle) {
      return common::Result<std::string>::success(session.session_id);
    }
    if (common::starts_with(session.session_id, needle)) {
      prefix_matches.push_back(session.session_id);
    }
  }
  if (prefix_matches.size() == 1) {
    return common::Result<std::string>::success(prefix_matches.front());
  }
  if (prefix_matches.size() > 1) {
    std::string candidates;
    for (const auto &id : prefix_matches) {
      candidates += candidates.empty() ? id : ", " + id;
    }
    return common::Result<std::string>::failure("ambiguous session prefix '" + needle +
                                                    "': " + candidates,
                                                common::ErrorCode::InvalidArgument);
  }

  // Listing is sorted by most recent update, so the first title hit wins.
  const std::string lowered = common::to_lower(needle);
  for (const auto &session : sessions.value()) {
    if (common::to_lower(session.title).find(lowered) != std::string::npos) {
      return common::Result<std::string>::success(session.session_id);
    }
  }
  return common::Result<std::string>::failure("no session matches '" + needle + "'",
                                              common::ErrorCode::NotFound);
}

common::Result<LogSuffix> ConversationHistoryManager::messages_from(const std::string &session_id,
                                                                    const std::string &uuid) {
  if (auto cached = cache_.get_messages(session_id); cached.has_value()) {
    LogSuffix suffix;
    const auto it = std::find_if(cached->begin(), cached->end(),
                                 [&uuid](const ConversationMessage &m) { return m.uuid == uuid; });
    if (it != cached->end()) {
      suffix.found = true;
      suffix.messages.assign(std::make_move_iterator(it), std::make_move_iterator(cached->end()));
    }
    return common::Result<LogSuffix>::success(std::move(suffix));
  }
  return store_.read_log_from(session_id, uuid);
}

void ConversationHistoryManager::clear_cache(const std::optional<std::string> &session_id) {
  if (session_id.has_value()) {
    cache_.invalidate(*session_id);
    return;
  }
  cache_.invalidate_all();
}

} // namespace convlog::history
