#pragma once

#include "convlog/observability/observer.hpp"

#include <memory>

namespace convlog::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session(const std::string &action, const std::string &session_id);
void record_message_appended(const std::string &session_id, const std::string &uuid,
                             const std::string &type, bool summary);
void record_duplicate(const std::string &session_id, const std::string &uuid,
                      const std::string &type, const std::string &content);
void record_recovery(const std::string &session_id, const std::string &strategy,
                     std::size_t messages, std::size_t estimated_tokens);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace convlog::observability
