#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace convlog::observability {

struct SessionEvent {
  std::string action;
  std::string session_id;
};

struct MessageAppendedEvent {
  std::string session_id;
  std::string uuid;
  std::string type;
  bool summary = false;
};

struct DuplicateDroppedEvent {
  std::string session_id;
  std::string uuid;
  std::string type;
  std::string preview;
};

struct RecoveryEvent {
  std::string session_id;
  std::string strategy;
  std::size_t messages = 0;
  std::size_t estimated_tokens = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SessionEvent, MessageAppendedEvent, DuplicateDroppedEvent,
                                   RecoveryEvent, WarningEvent, ErrorEvent>;

struct CacheLookupMetric {
  bool hit = false;
};

struct LogLoadMetric {
  std::size_t lines = 0;
  std::size_t skipped = 0;
};

struct RecoveryWindowMetric {
  std::size_t messages = 0;
  std::size_t tokens = 0;
};

using ObserverMetric = std::variant<CacheLookupMetric, LogLoadMetric, RecoveryWindowMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace convlog::observability
