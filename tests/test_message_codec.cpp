#include "test_framework.hpp"

#include "convlog/history/message.hpp"
#include "convlog/history/metadata.hpp"

#include <string>

void register_message_codec_tests(std::vector<convlog::tests::TestCase> &tests) {
  using convlog::tests::require;
  namespace h = convlog::history;

  tests.push_back({"message_encode_uses_log_key_order", [] {
                     h::ConversationMessage message;
                     message.uuid = "u1";
                     message.session_id = "s1";
                     message.type = h::MessageType::User;
                     message.message.role = "user";
                     message.message.content = "Hello \"world\"\n";
                     message.timestamp = "2024-05-01T10:00:00.000Z";
                     message.cwd = "/work";
                     message.version = "1.0.0";

                     const std::string line = h::encode_message_jsonl(message);
                     require(line ==
                                 "{\"parentUuid\":null,\"isSidechain\":false,\"userType\":"
                                 "\"external\",\"cwd\":\"/work\",\"sessionId\":\"s1\","
                                 "\"version\":\"1.0.0\",\"type\":\"user\",\"message\":{\"role\":"
                                 "\"user\",\"content\":\"Hello \\\"world\\\"\\n\"},\"uuid\":\"u1\","
                                 "\"timestamp\":\"2024-05-01T10:00:00.000Z\"}",
                             "unexpected encoding: " + line);
                     require(line.find('\n') == std::string::npos, "line must be single-line");
                   }});

  tests.push_back({"message_parse_restores_fields_and_unknowns", [] {
                     const std::string line =
                         R"({"parentUuid":"u1","isSidechain":true,"userType":"internal",)"
                         R"("cwd":"/w","sessionId":"s1","version":"1.0.0","type":"assistant",)"
                         R"("message":{"role":"assistant","content":"Hi","model":"m-1",)"
                         R"("usage":{"input_tokens":3},"custom":[1,2]},"uuid":"u2",)"
                         R"("timestamp":"2024-05-01T10:00:01.000Z","isSummary":true,)"
                         R"("requestId":"req-9"})";
                     auto parsed = h::parse_message_jsonl(line);
                     require(parsed.ok(), parsed.error());
                     const auto &m = parsed.value();
                     require(m.parent_uuid == std::optional<std::string>("u1"), "parent");
                     require(m.is_sidechain, "sidechain");
                     require(m.user_type == h::UserType::Internal, "user type");
                     require(m.type == h::MessageType::Assistant, "type");
                     require(m.message.model == std::optional<std::string>("m-1"), "model");
                     require(m.message.usage == std::optional<std::string>(R"({"input_tokens":3})"),
                             "usage raw");
                     require(m.message.extra.size() == 1 && m.message.extra[0].first == "custom",
                             "payload unknowns preserved");
                     require(m.is_summary, "isSummary");
                     require(m.extra.size() == 1 && m.extra[0].second == "\"req-9\"",
                             "top-level unknowns preserved");

                     auto again = h::parse_message_jsonl(h::encode_message_jsonl(m));
                     require(again.ok(), again.error());
                     require(h::encode_message_jsonl(again.value()) == h::encode_message_jsonl(m),
                             "re-encoding should be stable");
                   }});

  tests.push_back({"message_parse_rejects_malformed_lines", [] {
                     require(!h::parse_message_jsonl("").ok(), "empty line");
                     require(!h::parse_message_jsonl("{not json").ok(), "broken json");
                     require(!h::parse_message_jsonl(R"({"type":"user","message":{"role":"user"}})")
                                  .ok(),
                             "missing uuid");
                     require(!h::parse_message_jsonl(
                                  R"({"uuid":"u","type":"robot","message":{"role":"user"}})")
                                  .ok(),
                             "unknown type");
                     require(!h::parse_message_jsonl(R"({"uuid":"u","type":"user"})").ok(),
                             "missing payload");
                     auto bad = h::parse_message_jsonl(
                         R"({"uuid":"u","type":"user","message":{"role":"user"},"parentUuid":5})");
                     require(!bad.ok(), "numeric parent");
                     require(bad.code() == convlog::common::ErrorCode::Parse, "parse code");
                   }});

  tests.push_back({"message_payload_kind_and_tool_calls", [] {
                     auto parsed = h::parse_payload_json(
                         R"({"role":"assistant","content":null,"tool_calls":[)"
                         R"({"id":"call_1","type":"function","function":{"name":"read_file",)"
                         R"("arguments":"{\"path\":\"a.txt\"}"}},)"
                         R"({"id":"call_2","name":"grep","args":{"q":"x"}}]})");
                     require(parsed.ok(), parsed.error());
                     const auto &payload = parsed.value();
                     require(payload.kind() == h::PayloadKind::ToolCall, "tool call kind");
                     require(payload.raw_content == std::optional<std::string>("null"),
                             "null content kept raw");
                     const auto calls = payload.parsed_tool_calls();
                     require(calls.size() == 2, "two tool calls");
                     require(calls[0].id == "call_1" && calls[0].name == "read_file",
                             "openai shape");
                     require(calls[0].arguments == R"({"path":"a.txt"})", "arguments decoded");
                     require(calls[1].name == "grep" && calls[1].arguments == R"({"q":"x"})",
                             "flat shape");
                     require(h::encode_payload_json(payload).find("\"content\":null") !=
                                 std::string::npos,
                             "raw content re-encoded verbatim");

                     auto result = h::parse_payload_json(
                         R"({"role":"tool","content":"42","tool_call_id":"call_1"})");
                     require(result.ok(), result.error());
                     require(result.value().kind() == h::PayloadKind::ToolResult, "tool result");

                     auto text = h::parse_payload_json(R"({"role":"user","content":"hi"})");
                     require(text.ok() && text.value().kind() == h::PayloadKind::Text, "text");
                     require(!h::parse_payload_json(R"({"content":"hi"})").ok(), "role required");
                   }});

  tests.push_back({"message_summary_detection", [] {
                     h::ConversationMessage message;
                     message.type = h::MessageType::Assistant;
                     message.message.content = "plain reply";
                     require(!h::is_summary_message(message), "plain assistant");
                     message.is_summary = true;
                     require(h::is_summary_message(message), "flagged summary");
                     message.is_summary = false;
                     message.message.content = "[CONVERSATION_SUMMARY] earlier turns";
                     require(h::is_summary_message(message), "marker summary");
                     message.type = h::MessageType::User;
                     require(!h::is_summary_message(message), "user messages are never summaries");
                   }});

  tests.push_back({"metadata_pretty_encoding_and_parse", [] {
                     h::SessionMetadata metadata;
                     metadata.session_id = "s1";
                     metadata.title = "Refactor \"parser\"";
                     metadata.created = "2024-05-01T10:00:00.000Z";
                     metadata.updated = "2024-05-01T10:05:00.000Z";
                     metadata.message_count = 4;
                     metadata.cwd = "/w";
                     metadata.version = "1.0.0";

                     const std::string plain = h::encode_metadata_json(metadata);
                     require(plain.rfind("{\n  \"sessionId\": \"s1\",\n  \"title\": ", 0) == 0,
                             "pretty layout: " + plain);
                     require(plain.find("lastSummaryUuid") == std::string::npos,
                             "no pointer without a summary");

                     metadata.has_summary = true;
                     metadata.last_summary_uuid = "u3";
                     metadata.last_summary_time = "2024-05-01T10:02:00.000Z";
                     metadata.last_summary_index = 2;
                     metadata.summary = "short preview";
                     auto parsed = h::parse_metadata_json(h::encode_metadata_json(metadata));
                     require(parsed.ok(), parsed.error());
                     const auto &m = parsed.value();
                     require(m.title == "Refactor \"parser\"", "title");
                     require(m.message_count == 4, "count");
                     require(m.has_summary, "has summary");
                     require(m.last_summary_uuid == std::optional<std::string>("u3"), "uuid");
                     require(m.last_summary_index == std::optional<std::size_t>(2), "index");
                     require(m.summary == std::optional<std::string>("short preview"), "summary");
                   }});

  tests.push_back({"metadata_parse_tolerates_missing_optional_fields", [] {
                     auto parsed = h::parse_metadata_json(
                         R"({"sessionId":"s1","title":"t","created":"c","updated":"u",)"
                         R"("messageCount":0,"cwd":"/","lastSummaryUuid":"u9"})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().has_summary, "pointer implies hasSummary");
                     require(!parsed.value().last_summary_index.has_value(), "no index");
                     require(!h::parse_metadata_json(R"({"title":"t"})").ok(),
                             "sessionId required");
                     require(!h::parse_metadata_json(R"({"sessionId":"s","messageCount":-1})").ok(),
                             "negative count");
                   }});
}
