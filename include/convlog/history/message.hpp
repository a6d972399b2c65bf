#pragma once

#include "convlog/common/json_util.hpp"
#include "convlog/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace convlog::history {

/// Content prefix that marks a compressed-history summary.
inline constexpr std::string_view SUMMARY_MARKER = "[CONVERSATION_SUMMARY]";

enum class MessageType {
  User,
  Assistant,
  System,
};

[[nodiscard]] std::string message_type_to_string(MessageType type);
[[nodiscard]] std::optional<MessageType> message_type_from_string(std::string_view value);

enum class UserType {
  External,
  Internal,
};

[[nodiscard]] std::string user_type_to_string(UserType type);
[[nodiscard]] std::optional<UserType> user_type_from_string(std::string_view value);

enum class PayloadKind {
  Text,
  ToolCall,
  ToolResult,
};

struct ToolCall {
  std::string id;
  std::string name;
  // JSON-encoded argument object as sent by the model.
  std::string arguments;
};

struct MessagePayload {
  std::string role;
  std::string content;
  // Set when "content" is not a JSON string (null or a parts array); written back verbatim.
  std::optional<std::string> raw_content;
  std::optional<std::string> name;
  std::optional<std::string> tool_calls; // raw JSON array
  std::optional<std::string> tool_call_id;
  std::optional<std::string> model;
  std::optional<std::string> usage; // raw JSON object
  common::JsonMembers extra;

  [[nodiscard]] PayloadKind kind() const;
  /// Typed view of tool_calls. Entries that are not objects are skipped.
  [[nodiscard]] std::vector<ToolCall> parsed_tool_calls() const;
};

struct ConversationMessage {
  std::string uuid;
  std::optional<std::string> parent_uuid;
  std::string session_id;
  MessageType type = MessageType::User;
  MessagePayload message;
  std::string timestamp;
  std::string cwd;
  bool is_sidechain = false;
  UserType user_type = UserType::External;
  std::string version;
  bool is_summary = false;
  // Unknown top-level fields, in file order.
  common::JsonMembers extra;
};

[[nodiscard]] bool is_summary_message(const ConversationMessage &message);

[[nodiscard]] std::string encode_payload_json(const MessagePayload &payload);
[[nodiscard]] common::Result<MessagePayload> parse_payload_json(const std::string &json);

/// InvalidArgument when a raw JSON field (content, tool_calls, usage, extras) is malformed.
[[nodiscard]] common::Status validate_raw_json(const ConversationMessage &message);

/// One compact JSON object, no trailing newline. Raw fields are compacted.
[[nodiscard]] std::string encode_message_jsonl(const ConversationMessage &message);
[[nodiscard]] common::Result<ConversationMessage> parse_message_jsonl(const std::string &line);

} // namespace convlog::history
