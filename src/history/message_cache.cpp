#include "convlog/history/message_cache.hpp"

#include "convlog/observability/global.hpp"

namespace convlog::history {

MessageCache::MessageCache(const std::chrono::milliseconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

MessageCache::TimePoint MessageCache::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool MessageCache::messages_live(const Entry &entry, const TimePoint at) const {
  return entry.messages.has_value() && at < entry.messages_expiry;
}

bool MessageCache::metadata_live(const Entry &entry, const TimePoint at) const {
  return entry.metadata.has_value() && at < entry.metadata_expiry;
}

std::optional<std::vector<ConversationMessage>>
MessageCache::get_messages(const std::string &session_id) {
  std::optional<std::vector<ConversationMessage>> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(session_id);
    if (it != entries_.end() && messages_live(it->second, now())) {
      ++hits_;
      out = it->second.messages;
    } else {
      ++misses_;
      if (it != entries_.end()) {
        it->second.messages.reset();
      }
    }
  }
  observability::record_metric(observability::CacheLookupMetric{.hit = out.has_value()});
  return out;
}

void MessageCache::set_messages(const std::string &session_id,
                                std::vector<ConversationMessage> messages) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &entry = entries_[session_id];
  entry.messages = std::move(messages);
  entry.messages_expiry = now() + ttl_;
}

bool MessageCache::append_message(const std::string &session_id,
                                  const ConversationMessage &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(session_id);
  if (it == entries_.end() || !messages_live(it->second, now())) {
    return false;
  }
  // Appending does not extend the entry's lifetime.
  it->second.messages->push_back(message);
  return true;
}

std::optional<SessionMetadata> MessageCache::get_metadata(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(session_id);
  if (it != entries_.end() && metadata_live(it->second, now())) {
    ++hits_;
    return it->second.metadata;
  }
  ++misses_;
  return std::nullopt;
}

void MessageCache::set_metadata(const std::string &session_id, SessionMetadata metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &entry = entries_[session_id];
  entry.metadata = std::move(metadata);
  entry.metadata_expiry = now() + ttl_;
}

bool MessageCache::is_valid(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(session_id);
  return it != entries_.end() && messages_live(it->second, now());
}

void MessageCache::invalidate(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(session_id);
}

void MessageCache::invalidate_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

CacheStats MessageCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  const auto at = now();
  for (const auto &[session_id, entry] : entries_) {
    (void)session_id;
    if (messages_live(entry, at)) {
      ++stats.message_sessions;
    }
    if (metadata_live(entry, at)) {
      ++stats.metadata_sessions;
    }
  }
  stats.hits = hits_;
  stats.misses = misses_;
  return stats;
}

} // namespace convlog::history
