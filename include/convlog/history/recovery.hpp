#pragma once

#include "convlog/common/result.hpp"
#include "convlog/config/schema.hpp"
#include "convlog/history/manager.hpp"
#include "convlog/history/message.hpp"
#include "convlog/history/token_estimator.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convlog::history {

/// Produces one summary message for the given messages.
using Compressor =
    std::function<common::Result<ConversationMessage>(const std::vector<ConversationMessage> &)>;

enum class RecoveryStrategy {
  FullLog,
  FromSummary,
  Compressed,
  SlidingWindow,
};

[[nodiscard]] std::string_view recovery_strategy_name(RecoveryStrategy strategy);

struct RecoveryOptions {
  double compression_threshold = 0.8;
  double fallback_window_ratio = 0.8;
  std::size_t avg_tokens_per_message = 100;
};

[[nodiscard]] RecoveryOptions recovery_options_from_config(const config::Config &config);

struct RecoveryWindow {
  std::vector<ConversationMessage> messages;
  RecoveryStrategy strategy = RecoveryStrategy::FullLog;
  // Estimate for the candidate window before any compression.
  std::size_t estimated_tokens = 0;
  std::optional<std::size_t> summary_index;
};

/// Rebuilds a bounded resume window from a session's log.
class ContextRecoveryEngine {
public:
  explicit ContextRecoveryEngine(ConversationHistoryManager &manager,
                                 RecoveryOptions options = {});

  [[nodiscard]] common::Result<RecoveryWindow> recover(const std::string &session_id,
                                                       std::size_t token_limit,
                                                       const TokenEstimator &estimate,
                                                       const Compressor &compress = {});

  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  load_session_with_context_optimization(const std::string &session_id, std::size_t token_limit,
                                         const TokenEstimator &estimate,
                                         const Compressor &compress = {});

  /// Messages from the most recent summary onward, or the full log when there is none.
  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  load_session_from_summary_point(const std::string &session_id);

  /// Number of trailing messages kept when compression is unavailable. Never zero.
  [[nodiscard]] std::size_t sliding_window_size(std::size_t token_limit) const;

  [[nodiscard]] const RecoveryOptions &options() const { return options_; }

private:
  [[nodiscard]] std::optional<ConversationMessage>
  compress_and_persist(const std::string &session_id,
                       const std::vector<ConversationMessage> &log,
                       const std::vector<ConversationMessage> &candidate,
                       const Compressor &compress);

  ConversationHistoryManager &manager_;
  RecoveryOptions options_;
};

} // namespace convlog::history
