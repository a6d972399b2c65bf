#include "convlog/history/checkpoint.hpp"

#include <optional>

namespace convlog::history {

namespace {

common::Result<std::optional<std::string>>
last_persisted_uuid(ConversationHistoryManager &manager, const std::string &session_id) {
  auto messages = manager.get_messages(session_id);
  if (!messages.ok()) {
    return common::Result<std::optional<std::string>>::failure_from(messages);
  }
  if (messages.value().empty()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return common::Result<std::optional<std::string>>::success(messages.value().back().uuid);
}

} // namespace

CheckpointAdapter::CheckpointAdapter(ConversationHistoryManager &manager) : manager_(manager) {}

common::Result<DedupOutcome> CheckpointAdapter::persist_turn(
    const std::string &session_id, const ConversationTurn &turn,
    const std::optional<std::string> &parent_uuid) {
  ConversationMessage message =
      manager_.create_message(turn.type, turn.message.content, parent_uuid, session_id);
  const std::string role = message.message.role;
  message.message = turn.message;
  if (message.message.role.empty()) {
    message.message.role = role;
  }
  message.is_sidechain = turn.is_sidechain;
  return manager_.add_message_with_deduplication(session_id, message);
}

common::Result<DedupOutcome> CheckpointAdapter::save_message(const std::string &session_id,
                                                             const MessageType type,
                                                             const std::string &content) {
  ConversationTurn turn;
  turn.type = type;
  turn.message.content = content;
  return save_turn(session_id, turn);
}

common::Result<DedupOutcome> CheckpointAdapter::save_turn(const std::string &session_id,
                                                          const ConversationTurn &turn) {
  auto parent = last_persisted_uuid(manager_, session_id);
  if (!parent.ok()) {
    return common::Result<DedupOutcome>::failure_from(parent);
  }
  return persist_turn(session_id, turn, parent.value());
}

common::Result<std::size_t>
CheckpointAdapter::save_complete_conversation(const std::string &session_id,
                                              const std::vector<ConversationTurn> &turns) {
  auto existing = manager_.get_messages(session_id);
  if (!existing.ok()) {
    return common::Result<std::size_t>::failure_from(existing);
  }
  const std::size_t existing_count = existing.value().size();
  if (turns.size() <= existing_count) {
    return common::Result<std::size_t>::success(0);
  }

  std::optional<std::string> parent;
  if (!existing.value().empty()) {
    parent = existing.value().back().uuid;
  }

  std::size_t persisted = 0;
  for (std::size_t i = existing_count; i < turns.size(); ++i) {
    auto outcome = persist_turn(session_id, turns[i], parent);
    if (!outcome.ok()) {
      return common::Result<std::size_t>::failure_from(outcome);
    }
    // A dropped duplicate still anchors the next turn.
    parent = outcome.value().uuid;
    if (outcome.value().appended) {
      ++persisted;
    }
  }
  return common::Result<std::size_t>::success(persisted);
}

} // namespace convlog::history
