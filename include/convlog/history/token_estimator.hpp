#pragma once

#include "convlog/common/result.hpp"
#include "convlog/history/message.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace convlog::history {

using TokenEstimator = std::function<std::size_t(const std::vector<ConversationMessage> &)>;

/// ceil(total content characters / 3).
[[nodiscard]] std::size_t estimate_tokens_simple(const std::vector<ConversationMessage> &messages);

/// Per message: 4 + ceil(cjk / 1.5) + ceil(english_words / 0.75) + ceil(other / 2).
[[nodiscard]] std::size_t
estimate_tokens_enhanced(const std::vector<ConversationMessage> &messages);

/// "simple" or "enhanced".
[[nodiscard]] common::Result<TokenEstimator> estimator_by_name(std::string_view name);

} // namespace convlog::history
