#pragma once

#include "convlog/common/result.hpp"
#include "convlog/history/manager.hpp"
#include "convlog/history/message.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace convlog::history {

/// One turn as produced by the reasoning engine, before it is chain-linked.
struct ConversationTurn {
  MessageType type = MessageType::User;
  MessagePayload message;
  bool is_sidechain = false;
};

/// Reconciles an externally held turn list into the session's chain-linked log.
class CheckpointAdapter {
public:
  explicit CheckpointAdapter(ConversationHistoryManager &manager);

  [[nodiscard]] common::Result<DedupOutcome> save_message(const std::string &session_id,
                                                          MessageType type,
                                                          const std::string &content);
  [[nodiscard]] common::Result<DedupOutcome> save_turn(const std::string &session_id,
                                                       const ConversationTurn &turn);

  /// Persists the turns past the ones already logged. Returns the number appended.
  [[nodiscard]] common::Result<std::size_t>
  save_complete_conversation(const std::string &session_id,
                             const std::vector<ConversationTurn> &turns);

private:
  [[nodiscard]] common::Result<DedupOutcome>
  persist_turn(const std::string &session_id, const ConversationTurn &turn,
               const std::optional<std::string> &parent_uuid);

  ConversationHistoryManager &manager_;
};

} // namespace convlog::history
