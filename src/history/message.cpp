#include "convlog/history/message.hpp"

#include "convlog/common/fs.hpp"

#include <sstream>

namespace convlog::history {

namespace {

using common::json_quote;

std::optional<bool> parse_bool(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

bool starts_with_char(const std::string &raw, const char ch) {
  return !raw.empty() && raw.front() == ch;
}

std::string string_or_raw(const std::string &raw) {
  if (auto decoded = common::json_string_value(raw); decoded.has_value()) {
    return *decoded;
  }
  return raw;
}

common::Result<ConversationMessage> parse_failure(const std::string &message) {
  return common::Result<ConversationMessage>::failure(message, common::ErrorCode::Parse);
}

} // namespace

std::string message_type_to_string(const MessageType type) {
  switch (type) {
  case MessageType::User:
    return "user";
  case MessageType::Assistant:
    return "assistant";
  case MessageType::System:
    return "system";
  }
  return "user";
}

std::optional<MessageType> message_type_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "user") {
    return MessageType::User;
  }
  if (normalized == "assistant") {
    return MessageType::Assistant;
  }
  if (normalized == "system") {
    return MessageType::System;
  }
  return std::nullopt;
}

std::string user_type_to_string(const UserType type) {
  switch (type) {
  case UserType::External:
    return "external";
  case UserType::Internal:
    return "internal";
  }
  return "external";
}

std::optional<UserType> user_type_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "external") {
    return UserType::External;
  }
  if (normalized == "internal") {
    return UserType::Internal;
  }
  return std::nullopt;
}

PayloadKind MessagePayload::kind() const {
  if (tool_calls.has_value()) {
    return PayloadKind::ToolCall;
  }
  if (tool_call_id.has_value()) {
    return PayloadKind::ToolResult;
  }
  return PayloadKind::Text;
}

std::vector<ToolCall> MessagePayload::parsed_tool_calls() const {
  std::vector<ToolCall> out;
  if (!tool_calls.has_value()) {
    return out;
  }
  const auto elements = common::json_array_elements(*tool_calls);
  if (!elements.has_value()) {
    return out;
  }

  for (const auto &element : *elements) {
    const auto members = common::json_object_members(element);
    if (!members.has_value()) {
      continue;
    }
    ToolCall call;
    if (const auto *id = common::json_find_member(*members, "id"); id != nullptr) {
      call.id = string_or_raw(*id);
    }

    // OpenAI shape: {"id", "type", "function": {"name", "arguments"}}.
    const auto *function = common::json_find_member(*members, "function");
    const auto function_members =
        function != nullptr ? common::json_object_members(*function) : std::nullopt;
    if (function_members.has_value()) {
      if (const auto *name = common::json_find_member(*function_members, "name")) {
        call.name = string_or_raw(*name);
      }
      if (const auto *args = common::json_find_member(*function_members, "arguments")) {
        call.arguments = string_or_raw(*args);
      }
    } else {
      // Flat shape: {"id", "name", "args"|"arguments"}.
      if (const auto *name = common::json_find_member(*members, "name")) {
        call.name = string_or_raw(*name);
      }
      if (const auto *args = common::json_find_member(*members, "arguments")) {
        call.arguments = string_or_raw(*args);
      } else if (const auto *flat_args = common::json_find_member(*members, "args")) {
        call.arguments = string_or_raw(*flat_args);
      }
    }
    out.push_back(std::move(call));
  }
  return out;
}

bool is_summary_message(const ConversationMessage &message) {
  if (message.type != MessageType::Assistant) {
    return false;
  }
  return message.is_summary ||
         message.message.content.compare(0, SUMMARY_MARKER.size(), SUMMARY_MARKER) == 0;
}

std::string encode_payload_json(const MessagePayload &payload) {
  std::ostringstream out;
  out << "{\"role\":" << json_quote(payload.role);
  out << ",\"content\":";
  if (payload.raw_content.has_value()) {
    out << common::json_compact(*payload.raw_content);
  } else {
    out << json_quote(payload.content);
  }
  if (payload.name.has_value()) {
    out << ",\"name\":" << json_quote(*payload.name);
  }
  if (payload.tool_calls.has_value()) {
    out << ",\"tool_calls\":" << common::json_compact(*payload.tool_calls);
  }
  if (payload.tool_call_id.has_value()) {
    out << ",\"tool_call_id\":" << json_quote(*payload.tool_call_id);
  }
  if (payload.model.has_value()) {
    out << ",\"model\":" << json_quote(*payload.model);
  }
  if (payload.usage.has_value()) {
    out << ",\"usage\":" << common::json_compact(*payload.usage);
  }
  for (const auto &[key, raw] : payload.extra) {
    out << "," << json_quote(key) << ":" << common::json_compact(raw);
  }
  out << "}";
  return out.str();
}

common::Result<MessagePayload> parse_payload_json(const std::string &json) {
  const auto members = common::json_object_members(json);
  if (!members.has_value()) {
    return common::Result<MessagePayload>::failure("message payload is not a JSON object",
                                                   common::ErrorCode::Parse);
  }

  MessagePayload payload;
  bool has_role = false;
  for (const auto &[key, raw] : *members) {
    const auto text = common::json_string_value(raw);
    if (key == "role" && text.has_value()) {
      payload.role = *text;
      has_role = true;
    } else if (key == "content") {
      if (text.has_value()) {
        payload.content = *text;
      } else {
        payload.raw_content = raw;
      }
    } else if (key == "name" && text.has_value()) {
      payload.name = *text;
    } else if (key == "tool_calls" && starts_with_char(raw, '[')) {
      payload.tool_calls = raw;
    } else if (key == "tool_call_id" && text.has_value()) {
      payload.tool_call_id = *text;
    } else if (key == "model" && text.has_value()) {
      payload.model = *text;
    } else if (key == "usage" && starts_with_char(raw, '{')) {
      payload.usage = raw;
    } else {
      payload.extra.emplace_back(key, raw);
    }
  }

  if (!has_role) {
    return common::Result<MessagePayload>::failure("message role missing",
                                                   common::ErrorCode::Parse);
  }
  return common::Result<MessagePayload>::success(std::move(payload));
}

common::Status validate_raw_json(const ConversationMessage &message) {
  const auto check = [](const std::string &field, const std::string &raw) {
    if (common::json_is_valid(raw)) {
      return common::Status::success();
    }
    return common::Status::error("field " + field + " is not valid JSON",
                                 common::ErrorCode::InvalidArgument);
  };
  const MessagePayload &payload = message.message;
  if (payload.raw_content.has_value()) {
    if (auto status = check("message.content", *payload.raw_content); !status.ok()) {
      return status;
    }
  }
  if (payload.tool_calls.has_value()) {
    if (auto status = check("message.tool_calls", *payload.tool_calls); !status.ok()) {
      return status;
    }
  }
  if (payload.usage.has_value()) {
    if (auto status = check("message.usage", *payload.usage); !status.ok()) {
      return status;
    }
  }
  for (const auto &[key, raw] : payload.extra) {
    if (auto status = check("message." + key, raw); !status.ok()) {
      return status;
    }
  }
  for (const auto &[key, raw] : message.extra) {
    if (auto status = check(key, raw); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

std::string encode_message_jsonl(const ConversationMessage &message) {
  std::ostringstream out;
  out << "{\"parentUuid\":";
  if (message.parent_uuid.has_value()) {
    out << json_quote(*message.parent_uuid);
  } else {
    out << "null";
  }
  out << ",\"isSidechain\":" << (message.is_sidechain ? "true" : "false");
  out << ",\"userType\":" << json_quote(user_type_to_string(message.user_type));
  out << ",\"cwd\":" << json_quote(message.cwd);
  out << ",\"sessionId\":" << json_quote(message.session_id);
  out << ",\"version\":" << json_quote(message.version);
  out << ",\"type\":" << json_quote(message_type_to_string(message.type));
  out << ",\"message\":" << encode_payload_json(message.message);
  out << ",\"uuid\":" << json_quote(message.uuid);
  out << ",\"timestamp\":" << json_quote(message.timestamp);
  if (message.is_summary) {
    out << ",\"isSummary\":true";
  }
  for (const auto &[key, raw] : message.extra) {
    out << "," << json_quote(key) << ":" << common::json_compact(raw);
  }
  out << "}";
  return out.str();
}

common::Result<ConversationMessage> parse_message_jsonl(const std::string &line) {
  if (common::trim(line).empty()) {
    return parse_failure("empty log line");
  }
  const auto members = common::json_object_members(line);
  if (!members.has_value()) {
    return parse_failure("log line is not a JSON object");
  }

  ConversationMessage message;
  bool has_type = false;
  bool has_payload = false;
  for (const auto &[key, raw] : *members) {
    if (key == "parentUuid") {
      if (raw == "null") {
        message.parent_uuid = std::nullopt;
      } else if (auto parent = common::json_string_value(raw); parent.has_value()) {
        message.parent_uuid = std::move(*parent);
      } else {
        return parse_failure("parentUuid must be a string or null");
      }
    } else if (key == "isSidechain" || key == "isSummary") {
      const auto flag = parse_bool(raw);
      if (!flag.has_value()) {
        return parse_failure(key + " must be a boolean");
      }
      if (key == "isSidechain") {
        message.is_sidechain = *flag;
      } else {
        message.is_summary = *flag;
      }
    } else if (key == "userType") {
      const auto text = common::json_string_value(raw);
      const auto user_type =
          text.has_value() ? user_type_from_string(*text) : std::optional<UserType>{};
      message.user_type = user_type.value_or(UserType::External);
    } else if (key == "type") {
      const auto text = common::json_string_value(raw);
      const auto type =
          text.has_value() ? message_type_from_string(*text) : std::optional<MessageType>{};
      if (!type.has_value()) {
        return parse_failure("unknown message type: " + raw);
      }
      message.type = *type;
      has_type = true;
    } else if (key == "message") {
      auto payload = parse_payload_json(raw);
      if (!payload.ok()) {
        return common::Result<ConversationMessage>::failure_from(payload);
      }
      message.message = std::move(payload.value());
      has_payload = true;
    } else if (key == "uuid" || key == "sessionId" || key == "cwd" || key == "version" ||
               key == "timestamp") {
      auto text = common::json_string_value(raw);
      if (!text.has_value()) {
        return parse_failure(key + " must be a string");
      }
      if (key == "uuid") {
        message.uuid = std::move(*text);
      } else if (key == "sessionId") {
        message.session_id = std::move(*text);
      } else if (key == "cwd") {
        message.cwd = std::move(*text);
      } else if (key == "version") {
        message.version = std::move(*text);
      } else {
        message.timestamp = std::move(*text);
      }
    } else {
      message.extra.emplace_back(key, raw);
    }
  }

  if (message.uuid.empty()) {
    return parse_failure("message uuid missing");
  }
  if (!has_type) {
    return parse_failure("message type missing");
  }
  if (!has_payload) {
    return parse_failure("message payload missing");
  }
  return common::Result<ConversationMessage>::success(std::move(message));
}

} // namespace convlog::history
