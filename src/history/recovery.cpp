#include "convlog/history/recovery.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/common/time.hpp"
#include "convlog/common/uuid.hpp"
#include "convlog/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <iterator>

namespace convlog::history {

namespace {

constexpr const char *COMPONENT = "history.recovery";

std::optional<std::size_t> last_summary_index(const std::vector<ConversationMessage> &log) {
  for (std::size_t i = log.size(); i > 0; --i) {
    if (is_summary_message(log[i - 1])) {
      return i - 1;
    }
  }
  return std::nullopt;
}

} // namespace

std::string_view recovery_strategy_name(const RecoveryStrategy strategy) {
  switch (strategy) {
  case RecoveryStrategy::FullLog:
    return "full_log";
  case RecoveryStrategy::FromSummary:
    return "from_summary";
  case RecoveryStrategy::Compressed:
    return "compressed";
  case RecoveryStrategy::SlidingWindow:
    return "sliding_window";
  }
  return "full_log";
}

RecoveryOptions recovery_options_from_config(const config::Config &config) {
  RecoveryOptions options;
  options.compression_threshold = config.recovery.compression_threshold;
  options.fallback_window_ratio = config.recovery.fallback_window_ratio;
  options.avg_tokens_per_message =
      static_cast<std::size_t>(config.recovery.avg_tokens_per_message);
  return options;
}

ContextRecoveryEngine::ContextRecoveryEngine(ConversationHistoryManager &manager,
                                             RecoveryOptions options)
    : manager_(manager), options_(options) {}

std::size_t ContextRecoveryEngine::sliding_window_size(const std::size_t token_limit) const {
  if (options_.avg_tokens_per_message == 0) {
    return 1;
  }
  const double budget = static_cast<double>(token_limit) * options_.fallback_window_ratio;
  const auto count = static_cast<std::size_t>(
      std::floor(budget / static_cast<double>(options_.avg_tokens_per_message)));
  return std::max<std::size_t>(count, 1);
}

std::optional<ConversationMessage> ContextRecoveryEngine::compress_and_persist(
    const std::string &session_id, const std::vector<ConversationMessage> &log,
    const std::vector<ConversationMessage> &candidate, const Compressor &compress) {
  auto produced = [&]() -> common::Result<ConversationMessage> {
    try {
      return compress(candidate);
    } catch (const std::exception &e) {
      return common::Result<ConversationMessage>::failure(
          std::string("compressor threw: ") + e.what(), common::ErrorCode::Callback);
    } catch (...) {
      return common::Result<ConversationMessage>::failure("compressor threw a non-standard exception",
                                                          common::ErrorCode::Callback);
    }
  }();
  if (!produced.ok()) {
    observability::record_warning(COMPONENT, "compression failed for " + session_id + ": " +
                                                 produced.error());
    return std::nullopt;
  }

  ConversationMessage summary = std::move(produced.value());
  summary.type = MessageType::Assistant;
  summary.is_summary = true;
  if (!common::starts_with(summary.message.content, std::string(SUMMARY_MARKER))) {
    summary.message.content = std::string(SUMMARY_MARKER) + "\n" + summary.message.content;
  }
  if (summary.message.role.empty()) {
    summary.message.role = message_type_to_string(MessageType::Assistant);
  }
  summary.session_id = session_id;
  summary.parent_uuid = log.back().uuid;
  if (summary.uuid.empty()) {
    summary.uuid = common::generate_uuid();
  }
  if (summary.timestamp.empty()) {
    summary.timestamp = common::now_iso8601();
  }
  if (summary.cwd.empty()) {
    summary.cwd = manager_.options().cwd;
  }
  if (summary.version.empty()) {
    summary.version = manager_.options().version;
  }

  if (auto persisted = manager_.add_message(session_id, summary); !persisted.ok()) {
    observability::record_warning(COMPONENT, "failed to persist summary for " + session_id +
                                                 ": " + persisted.error());
    return std::nullopt;
  }
  return summary;
}

common::Result<RecoveryWindow> ContextRecoveryEngine::recover(const std::string &session_id,
                                                              const std::size_t token_limit,
                                                              const TokenEstimator &estimate,
                                                              const Compressor &compress) {
  if (!estimate) {
    return common::Result<RecoveryWindow>::failure("token estimator is required",
                                                   common::ErrorCode::InvalidArgument);
  }

  auto loaded = manager_.get_messages(session_id);
  if (!loaded.ok()) {
    return common::Result<RecoveryWindow>::failure_from(loaded);
  }
  const auto &log = loaded.value();

  RecoveryWindow window;
  if (log.empty()) {
    observability::record_recovery(session_id, std::string(recovery_strategy_name(window.strategy)),
                                   0, 0);
    return common::Result<RecoveryWindow>::success(std::move(window));
  }

  window.summary_index = last_summary_index(log);
  const std::size_t start = window.summary_index.value_or(0);
  std::vector<ConversationMessage> candidate(log.begin() + static_cast<std::ptrdiff_t>(start),
                                             log.end());
  window.strategy = window.summary_index.has_value() ? RecoveryStrategy::FromSummary
                                                     : RecoveryStrategy::FullLog;

  try {
    window.estimated_tokens = estimate(candidate);
  } catch (const std::exception &e) {
    return common::Result<RecoveryWindow>::failure(
        std::string("token estimator threw: ") + e.what(), common::ErrorCode::Callback);
  } catch (...) {
    return common::Result<RecoveryWindow>::failure("token estimator threw a non-standard exception",
                                                   common::ErrorCode::Callback);
  }

  const double budget = static_cast<double>(token_limit) * options_.compression_threshold;
  if (static_cast<double>(window.estimated_tokens) > budget && compress) {
    if (auto summary = compress_and_persist(session_id, log, candidate, compress);
        summary.has_value()) {
      window.messages.push_back(std::move(*summary));
      window.strategy = RecoveryStrategy::Compressed;
    } else {
      const std::size_t keep = std::min(sliding_window_size(token_limit), candidate.size());
      window.messages.assign(
          std::make_move_iterator(candidate.end() - static_cast<std::ptrdiff_t>(keep)),
          std::make_move_iterator(candidate.end()));
      window.strategy = RecoveryStrategy::SlidingWindow;
      observability::record_warning(COMPONENT, "falling back to the last " +
                                                   std::to_string(keep) + " messages of " +
                                                   session_id);
    }
  } else {
    window.messages = std::move(candidate);
  }

  observability::record_recovery(session_id, std::string(recovery_strategy_name(window.strategy)),
                                 window.messages.size(), window.estimated_tokens);
  observability::record_metric(observability::RecoveryWindowMetric{
      .messages = window.messages.size(), .tokens = window.estimated_tokens});
  return common::Result<RecoveryWindow>::success(std::move(window));
}

common::Result<std::vector<ConversationMessage>>
ContextRecoveryEngine::load_session_with_context_optimization(const std::string &session_id,
                                                              const std::size_t token_limit,
                                                              const TokenEstimator &estimate,
                                                              const Compressor &compress) {
  auto window = recover(session_id, token_limit, estimate, compress);
  if (!window.ok()) {
    return common::Result<std::vector<ConversationMessage>>::failure_from(window);
  }
  return common::Result<std::vector<ConversationMessage>>::success(
      std::move(window.value().messages));
}

common::Result<std::vector<ConversationMessage>>
ContextRecoveryEngine::load_session_from_summary_point(const std::string &session_id) {
  auto metadata = manager_.get_metadata(session_id);
  if (!metadata.ok()) {
    return common::Result<std::vector<ConversationMessage>>::failure_from(metadata);
  }
  if (!metadata.value().has_summary || !metadata.value().last_summary_uuid.has_value()) {
    return manager_.get_messages(session_id);
  }

  const std::string &anchor = *metadata.value().last_summary_uuid;
  auto suffix = manager_.messages_from(session_id, anchor);
  if (!suffix.ok()) {
    return common::Result<std::vector<ConversationMessage>>::failure_from(suffix);
  }
  if (suffix.value().found) {
    return common::Result<std::vector<ConversationMessage>>::success(
        std::move(suffix.value().messages));
  }

  observability::record_warning(COMPONENT, "summary " + anchor + " not found in " + session_id +
                                               ", loading the full log");
  return manager_.get_messages(session_id);
}

} // namespace convlog::history
