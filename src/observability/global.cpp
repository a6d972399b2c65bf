#include "convlog/observability/global.hpp"

#include <mutex>

namespace convlog::observability {

namespace {

constexpr std::size_t PREVIEW_LENGTH = 50;

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::string preview(const std::string &content) {
  if (content.size() <= PREVIEW_LENGTH) {
    return content;
  }
  std::size_t cut = PREVIEW_LENGTH;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return content.substr(0, cut) + "...";
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session(const std::string &action, const std::string &session_id) {
  record_event(SessionEvent{.action = action, .session_id = session_id});
}

void record_message_appended(const std::string &session_id, const std::string &uuid,
                             const std::string &type, const bool summary) {
  record_event(MessageAppendedEvent{
      .session_id = session_id, .uuid = uuid, .type = type, .summary = summary});
}

void record_duplicate(const std::string &session_id, const std::string &uuid,
                      const std::string &type, const std::string &content) {
  record_event(DuplicateDroppedEvent{
      .session_id = session_id, .uuid = uuid, .type = type, .preview = preview(content)});
}

void record_recovery(const std::string &session_id, const std::string &strategy,
                     const std::size_t messages, const std::size_t estimated_tokens) {
  record_event(RecoveryEvent{.session_id = session_id,
                             .strategy = strategy,
                             .messages = messages,
                             .estimated_tokens = estimated_tokens});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace convlog::observability
