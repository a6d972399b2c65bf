#pragma once

#include "convlog/history/message.hpp"
#include "convlog/history/metadata.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace convlog::history {

struct CacheStats {
  std::size_t message_sessions = 0;
  std::size_t metadata_sessions = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
};

/// Per-session cache of messages and metadata. Each half expires independently after the TTL.
class MessageCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::chrono::milliseconds DEFAULT_TTL{5 * 60 * 1000};

  explicit MessageCache(std::chrono::milliseconds ttl = DEFAULT_TTL, Clock clock = {});

  [[nodiscard]] std::optional<std::vector<ConversationMessage>>
  get_messages(const std::string &session_id);
  void set_messages(const std::string &session_id, std::vector<ConversationMessage> messages);
  /// Pushes onto a valid cached array. Returns false (and caches nothing) otherwise.
  bool append_message(const std::string &session_id, const ConversationMessage &message);

  [[nodiscard]] std::optional<SessionMetadata> get_metadata(const std::string &session_id);
  void set_metadata(const std::string &session_id, SessionMetadata metadata);

  /// True while the session's messages are cached and unexpired.
  [[nodiscard]] bool is_valid(const std::string &session_id) const;
  void invalidate(const std::string &session_id);
  void invalidate_all();

  [[nodiscard]] CacheStats stats() const;
  [[nodiscard]] std::chrono::milliseconds ttl() const { return ttl_; }

private:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct Entry {
    std::optional<std::vector<ConversationMessage>> messages;
    TimePoint messages_expiry{};
    std::optional<SessionMetadata> metadata;
    TimePoint metadata_expiry{};
  };

  [[nodiscard]] TimePoint now() const;
  [[nodiscard]] bool messages_live(const Entry &entry, TimePoint at) const;
  [[nodiscard]] bool metadata_live(const Entry &entry, TimePoint at) const;

  std::chrono::milliseconds ttl_;
  Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};

} // namespace convlog::history
