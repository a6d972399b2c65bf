#pragma once

#include "convlog/common/result.hpp"
#include "convlog/config/schema.hpp"
#include "convlog/history/message.hpp"
#include "convlog/history/message_cache.hpp"
#include "convlog/history/metadata.hpp"
#include "convlog/history/session_store.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace convlog::history {

struct HistoryOptions {
  std::filesystem::path root_dir;
  std::string version = "1.0.0";
  UserType user_type = UserType::External;
  std::string cwd;
  std::chrono::milliseconds cache_ttl = MessageCache::DEFAULT_TTL;
  std::chrono::milliseconds dedup_window{5000};
};

/// Maps [history], [cache] and [dedup]; an empty default_cwd becomes the process cwd.
[[nodiscard]] HistoryOptions history_options_from_config(const config::Config &config);

struct DedupOutcome {
  bool appended = false;
  // Uuid of the stored message: the new one, or the existing duplicate.
  std::string uuid;
};

/// Sole writer of the history root. All operations take an explicit session id.
class ConversationHistoryManager {
public:
  explicit ConversationHistoryManager(HistoryOptions options, MessageCache::Clock clock = {});

  [[nodiscard]] ConversationMessage create_message(MessageType type, const std::string &content,
                                                   const std::optional<std::string> &parent_uuid,
                                                   const std::string &session_id) const;
  /// Assistant message carrying both the isSummary flag and the content marker.
  [[nodiscard]] ConversationMessage
  make_summary_message(const std::string &session_id, const std::string &content,
                       const std::optional<std::string> &parent_uuid) const;

  [[nodiscard]] common::Result<std::string>
  create_session(const std::optional<std::string> &title = std::nullopt);
  [[nodiscard]] common::Result<SessionMetadata>
  create_session_with_id(const std::string &session_id,
                         const std::optional<std::string> &title = std::nullopt);

  [[nodiscard]] common::Status add_message(const std::string &session_id,
                                           const ConversationMessage &message);
  [[nodiscard]] common::Result<DedupOutcome>
  add_message_with_deduplication(const std::string &session_id,
                                 const ConversationMessage &message);

  [[nodiscard]] common::Result<std::vector<SessionMetadata>> list_sessions() const;
  [[nodiscard]] common::Status delete_session(const std::string &session_id);
  [[nodiscard]] common::Status update_session_title(const std::string &session_id,
                                                    const std::string &title);
  [[nodiscard]] common::Status update_metadata(const std::string &session_id,
                                               const MetadataPatch &patch);

  /// Cache first; a miss loads from disk and refills the cache.
  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  get_messages(const std::string &session_id);
  /// Always reads the log from disk and refreshes the cache.
  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  load_session(const std::string &session_id);
  [[nodiscard]] common::Status save_session(const std::string &session_id,
                                            const std::vector<ConversationMessage> &messages);
  [[nodiscard]] common::Result<SessionMetadata> get_metadata(const std::string &session_id);

  /// Exact id, unique id prefix, then case-insensitive title substring (most recent wins).
  [[nodiscard]] common::Result<std::string> resolve_session_id(const std::string &query) const;

  /// Suffix of the log starting at uuid, from a valid cache entry or streamed from disk.
  [[nodiscard]] common::Result<LogSuffix> messages_from(const std::string &session_id,
                                                        const std::string &uuid);

  void clear_cache(const std::optional<std::string> &session_id = std::nullopt);
  [[nodiscard]] CacheStats cache_stats() const { return cache_.stats(); }
  /// Sessions with a live per-session mutex. Deleting a session drops its entry.
  [[nodiscard]] std::size_t session_lock_count() const;

  [[nodiscard]] const HistoryOptions &options() const { return options_; }
  [[nodiscard]] SessionStore &store() { return store_; }

private:
  [[nodiscard]] std::shared_ptr<std::mutex> session_mutex(const std::string &session_id);
  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  cached_messages(const std::string &session_id);
  [[nodiscard]] common::Status append_locked(const std::string &session_id,
                                             const ConversationMessage &message);
  [[nodiscard]] bool is_duplicate(const ConversationMessage &existing,
                                  const ConversationMessage &incoming) const;

  HistoryOptions options_;
  SessionStore store_;
  MessageCache cache_;
  mutable std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace convlog::history
