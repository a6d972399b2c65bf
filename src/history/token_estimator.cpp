#include "convlog/history/token_estimator.hpp"

#include "convlog/common/fs.hpp"

#include <cstdint>

namespace convlog::history {

namespace {

struct TextCounts {
  std::size_t characters = 0;
  std::size_t cjk = 0;
  std::size_t english_words = 0;
};

// Characters are Unicode code points; CJK covers the unified ideographs block.
TextCounts count_text(const std::string &text) {
  TextCounts counts;
  bool in_word = false;
  for (std::size_t i = 0; i < text.size();) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 1;
    std::uint32_t code_point = lead;
    if (lead >= 0xF0U && i + 3 < text.size()) {
      length = 4;
      code_point = ((lead & 0x07U) << 18U) |
                   ((static_cast<unsigned char>(text[i + 1]) & 0x3FU) << 12U) |
                   ((static_cast<unsigned char>(text[i + 2]) & 0x3FU) << 6U) |
                   (static_cast<unsigned char>(text[i + 3]) & 0x3FU);
    } else if (lead >= 0xE0U && i + 2 < text.size()) {
      length = 3;
      code_point = ((lead & 0x0FU) << 12U) |
                   ((static_cast<unsigned char>(text[i + 1]) & 0x3FU) << 6U) |
                   (static_cast<unsigned char>(text[i + 2]) & 0x3FU);
    } else if (lead >= 0xC0U && i + 1 < text.size()) {
      length = 2;
      code_point =
          ((lead & 0x1FU) << 6U) | (static_cast<unsigned char>(text[i + 1]) & 0x3FU);
    }

    ++counts.characters;
    if (code_point >= 0x4E00U && code_point <= 0x9FFFU) {
      ++counts.cjk;
    }
    const bool letter =
        (code_point >= 'a' && code_point <= 'z') || (code_point >= 'A' && code_point <= 'Z');
    if (letter && !in_word) {
      ++counts.english_words;
    }
    in_word = letter;
    i += length;
  }
  return counts;
}

std::size_t ceil_div(const std::size_t value, const double divisor) {
  const double scaled = static_cast<double>(value) / divisor;
  const auto whole = static_cast<std::size_t>(scaled);
  return static_cast<double>(whole) < scaled ? whole + 1 : whole;
}

} // namespace

std::size_t estimate_tokens_simple(const std::vector<ConversationMessage> &messages) {
  std::size_t characters = 0;
  for (const auto &message : messages) {
    characters += count_text(message.message.content).characters;
  }
  return (characters + 2) / 3;
}

std::size_t estimate_tokens_enhanced(const std::vector<ConversationMessage> &messages) {
  std::size_t total = 0;
  for (const auto &message : messages) {
    const TextCounts counts = count_text(message.message.content);
    // A word counts as one unit against the remaining characters.
    const std::size_t counted = counts.cjk + counts.english_words;
    const std::size_t symbols = counts.characters > counted ? counts.characters - counted : 0;
    total += 4 + ceil_div(counts.cjk, 1.5) + ceil_div(counts.english_words, 0.75) +
             ceil_div(symbols, 2.0);
  }
  return total;
}

common::Result<TokenEstimator> estimator_by_name(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  if (normalized == "simple") {
    return common::Result<TokenEstimator>::success(TokenEstimator(estimate_tokens_simple));
  }
  if (normalized == "enhanced") {
    return common::Result<TokenEstimator>::success(TokenEstimator(estimate_tokens_enhanced));
  }
  return common::Result<TokenEstimator>::failure("unknown token estimator: " + std::string(name),
                                                 common::ErrorCode::InvalidArgument);
}

} // namespace convlog::history
