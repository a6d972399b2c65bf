#include "convlog/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace convlog::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line("INFO", "session." + evt.action + " id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, MessageAppendedEvent>) {
          log_line("DEBUG", "message.append session=" + evt.session_id + " uuid=" + evt.uuid +
                                " type=" + evt.type +
                                (evt.summary ? std::string(" summary=true") : std::string()));
        } else if constexpr (std::is_same_v<T, DuplicateDroppedEvent>) {
          log_line("WARN", "message.duplicate session=" + evt.session_id + " uuid=" + evt.uuid +
                               " type=" + evt.type + " content=\"" + evt.preview + "\"");
        } else if constexpr (std::is_same_v<T, RecoveryEvent>) {
          log_line("INFO", "recovery session=" + evt.session_id + " strategy=" + evt.strategy +
                               " messages=" + std::to_string(evt.messages) +
                               " tokens=" + std::to_string(evt.estimated_tokens));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CacheLookupMetric>) {
          log_line("DEBUG", std::string("metric.cache_lookup hit=") + (m.hit ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, LogLoadMetric>) {
          log_line("DEBUG", "metric.log_load lines=" + std::to_string(m.lines) +
                                " skipped=" + std::to_string(m.skipped));
        } else if constexpr (std::is_same_v<T, RecoveryWindowMetric>) {
          log_line("DEBUG", "metric.recovery_window messages=" + std::to_string(m.messages) +
                                " tokens=" + std::to_string(m.tokens));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace convlog::observability
