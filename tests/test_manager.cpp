#include "test_framework.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/common/time.hpp"
#include "convlog/common/uuid.hpp"
#include "convlog/history/manager.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace h = convlog::history;

h::ConversationMessage at_time(h::ConversationMessage message, const std::string &timestamp) {
  message.timestamp = timestamp;
  return message;
}

} // namespace

void register_manager_tests(std::vector<convlog::tests::TestCase> &tests) {
  using convlog::tests::require;
  namespace c = convlog::common;
  using namespace std::chrono_literals;

  tests.push_back({"manager_create_message_fills_context", [] {
                     convlog::testing::TempWorkspace workspace;
                     auto options = convlog::testing::history_options(workspace);
                     options.user_type = h::UserType::Internal;
                     options.version = "3.0.0";
                     h::ConversationHistoryManager manager(options);

                     const auto message = manager.create_message(h::MessageType::Assistant, "Hi",
                                                                 std::string("p1"), "s1");
                     require(c::is_uuid(message.uuid), "uuid generated");
                     require(message.parent_uuid == std::optional<std::string>("p1"), "parent");
                     require(message.message.role == "assistant", "role follows type");
                     require(message.cwd == "/work/project", "cwd");
                     require(message.version == "3.0.0", "version");
                     require(message.user_type == h::UserType::Internal, "user type");
                     require(c::parse_iso8601(message.timestamp).has_value(), "timestamp");

                     const auto summary =
                         manager.make_summary_message("s1", "we discussed parsers", std::nullopt);
                     require(summary.is_summary, "summary flag");
                     require(summary.type == h::MessageType::Assistant, "summary is assistant");
                     require(summary.message.content.rfind("[CONVERSATION_SUMMARY]\n", 0) == 0,
                             "marker prefix");
                     const auto marked = manager.make_summary_message(
                         "s1", "[CONVERSATION_SUMMARY] already", std::nullopt);
                     require(marked.message.content == "[CONVERSATION_SUMMARY] already",
                             "marker not doubled");
                   }});

  tests.push_back({"manager_add_message_updates_metadata_and_summary_pointer", [] {
                     convlog::testing::ScopedRecorder recorder;
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     const auto first =
                         manager.create_message(h::MessageType::User, "Hello", std::nullopt, "s1");
                     require(manager.add_message("s1", first).ok(), "add first");
                     const auto summary = manager.make_summary_message("s1", "recap", first.uuid);
                     require(manager.add_message("s1", summary).ok(), "add summary");
                     const auto after = manager.create_message(h::MessageType::User, "more",
                                                               summary.uuid, "s1");
                     require(manager.add_message("s1", after).ok(), "add after");

                     auto metadata = manager.get_metadata("s1");
                     require(metadata.ok(), metadata.error());
                     require(metadata.value().message_count == 3, "count");
                     require(metadata.value().has_summary, "has summary");
                     require(metadata.value().last_summary_uuid ==
                                 std::optional<std::string>(summary.uuid),
                             "summary uuid");
                     require(metadata.value().last_summary_index ==
                                 std::optional<std::size_t>(1),
                             "summary index is the position in the log");
                     require(metadata.value().last_summary_time ==
                                 std::optional<std::string>(summary.timestamp),
                             "summary time");

                     auto on_disk = manager.store().load_metadata("s1");
                     require(on_disk.ok() && on_disk.value().message_count == 3,
                             "metadata persisted");
                     const auto appended =
                         recorder.events<convlog::observability::MessageAppendedEvent>();
                     require(appended.size() == 3 && appended[1].summary, "append events");
                   }});

  tests.push_back({"manager_add_message_rejects_bad_input", [] {
                     convlog::testing::ScopedRecorder recorder;
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     auto message =
                         manager.create_message(h::MessageType::User, "x", std::nullopt, "other");
                     auto mismatch = manager.add_message("s1", message);
                     require(mismatch.code() == c::ErrorCode::InvalidArgument, "session mismatch");

                     message.session_id.clear();
                     message.uuid.clear();
                     auto no_uuid = manager.add_message("s1", message);
                     require(no_uuid.code() == c::ErrorCode::InvalidArgument, "uuid required");

                     auto missing = manager.add_message(
                         "ghost",
                         manager.create_message(h::MessageType::User, "x", std::nullopt, "ghost"));
                     require(missing.code() == c::ErrorCode::NotFound, "unknown session");
                     require(!recorder.events<convlog::observability::ErrorEvent>().empty(),
                             "append failure reported");
                   }});

  tests.push_back({"manager_dedup_by_uuid_and_by_content_window", [] {
                     convlog::testing::ScopedRecorder recorder;
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     const auto base = at_time(
                         manager.create_message(h::MessageType::User, "Hi", std::nullopt, "s1"),
                         "2024-05-01T10:00:00.000Z");
                     auto first = manager.add_message_with_deduplication("s1", base);
                     require(first.ok() && first.value().appended, "first append");
                     require(first.value().uuid == base.uuid, "outcome carries uuid");

                     auto same_uuid = manager.add_message_with_deduplication("s1", base);
                     require(same_uuid.ok() && !same_uuid.value().appended, "same uuid dropped");

                     auto close = at_time(
                         manager.create_message(h::MessageType::User, "Hi", base.uuid, "s1"),
                         "2024-05-01T10:00:02.000Z");
                     auto dropped = manager.add_message_with_deduplication("s1", close);
                     require(dropped.ok() && !dropped.value().appended, "close repeat dropped");
                     require(dropped.value().uuid == base.uuid, "existing uuid returned");

                     auto other_type = at_time(manager.create_message(h::MessageType::Assistant,
                                                                      "Hi", base.uuid, "s1"),
                                               "2024-05-01T10:00:02.000Z");
                     auto typed = manager.add_message_with_deduplication("s1", other_type);
                     require(typed.ok() && typed.value().appended, "different type is kept");

                     auto later = at_time(
                         manager.create_message(h::MessageType::User, "Hi", base.uuid, "s1"),
                         "2024-05-01T10:00:05.000Z");
                     auto kept = manager.add_message_with_deduplication("s1", later);
                     require(kept.ok() && kept.value().appended, "window is exclusive");

                     auto undated =
                         manager.create_message(h::MessageType::User, "Hi", base.uuid, "s1");
                     undated.timestamp = "not a time";
                     auto unparsable = manager.add_message_with_deduplication("s1", undated);
                     require(unparsable.ok() && unparsable.value().appended,
                             "unparsable timestamps never match");

                     auto messages = manager.load_session("s1");
                     require(messages.ok() && messages.value().size() == 4, "four stored");
                     require(recorder.events<convlog::observability::DuplicateDroppedEvent>()
                                     .size() == 2,
                             "two duplicates reported");
                   }});

  tests.push_back({"manager_resolve_session_id", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("alpha-1", std::string("Refactor parser"))
                                 .ok(),
                             "create alpha-1");
                     std::this_thread::sleep_for(5ms);
                     require(manager.create_session_with_id("alpha-2", std::string("Parser tests"))
                                 .ok(),
                             "create alpha-2");
                     require(manager.create_session_with_id("beta", std::string("Release notes"))
                                 .ok(),
                             "create beta");

                     require(manager.resolve_session_id("beta").value() == "beta", "exact");
                     require(manager.resolve_session_id("  alpha-1 ").value() == "alpha-1",
                             "trimmed exact");
                     require(manager.resolve_session_id("be").value() == "beta", "unique prefix");

                     auto ambiguous = manager.resolve_session_id("alpha");
                     require(ambiguous.code() == c::ErrorCode::InvalidArgument, "ambiguous");
                     require(ambiguous.error().find("alpha-1") != std::string::npos &&
                                 ambiguous.error().find("alpha-2") != std::string::npos,
                             "candidates listed: " + ambiguous.error());

                     require(manager.resolve_session_id("RELEASE").value() == "beta",
                             "case-insensitive title");
                     require(manager.resolve_session_id("parser").value() == "alpha-2",
                             "most recently updated title wins");
                     require(manager.resolve_session_id("nothing").code() ==
                                 c::ErrorCode::NotFound,
                             "no match");
                     require(manager.resolve_session_id("   ").code() ==
                                 c::ErrorCode::InvalidArgument,
                             "empty query");
                   }});

  tests.push_back({"manager_cache_serves_reads_until_cleared", [] {
                     convlog::testing::ManualClock clock;
                     convlog::testing::TempWorkspace workspace;
                     auto options = convlog::testing::history_options(workspace);
                     options.cache_ttl = 1000ms;
                     h::ConversationHistoryManager manager(options, clock.clock());
                     require(manager.create_session_with_id("s1").ok(), "create");
                     const auto first =
                         manager.create_message(h::MessageType::User, "one", std::nullopt, "s1");
                     require(manager.add_message("s1", first).ok(), "add");

                     // Out-of-band write the cache does not know about.
                     const auto external = manager.create_message(h::MessageType::User, "two",
                                                                  first.uuid, "s1");
                     require(c::append_line(manager.store().log_path("s1"),
                                            h::encode_message_jsonl(external))
                                 .ok(),
                             "external append");

                     auto cached = manager.get_messages("s1");
                     require(cached.ok() && cached.value().size() == 1, "served from cache");

                     clock.advance(1000ms);
                     auto refreshed = manager.get_messages("s1");
                     require(refreshed.ok() && refreshed.value().size() == 2,
                             "expiry reloads from disk");

                     require(c::append_line(manager.store().log_path("s1"),
                                            h::encode_message_jsonl(manager.create_message(
                                                h::MessageType::User, "three", external.uuid, "s1")))
                                 .ok(),
                             "second external append");
                     manager.clear_cache("s1");
                     auto cleared = manager.get_messages("s1");
                     require(cleared.ok() && cleared.value().size() == 3, "clear forces reload");

                     auto disk = manager.load_session("s1");
                     require(disk.ok() && disk.value().size() == 3, "load_session reads disk");
                     require(manager.cache_stats().message_sessions == 1, "cache refilled");
                     manager.clear_cache();
                     require(manager.cache_stats().message_sessions == 0, "clear all");
                   }});

  tests.push_back({"manager_messages_from_cache_and_disk_agree", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");
                     std::optional<std::string> parent;
                     std::vector<std::string> uuids;
                     for (int i = 0; i < 4; ++i) {
                       auto message = manager.create_message(
                           h::MessageType::User, "m" + std::to_string(i), parent, "s1");
                       require(manager.add_message("s1", message).ok(), "add");
                       parent = message.uuid;
                       uuids.push_back(message.uuid);
                     }

                     auto from_cache = manager.messages_from("s1", uuids[2]);
                     require(from_cache.ok() && from_cache.value().found, "cache hit");
                     manager.clear_cache();
                     auto from_disk = manager.messages_from("s1", uuids[2]);
                     require(from_disk.ok() && from_disk.value().found, "disk hit");
                     require(from_cache.value().messages.size() == 2 &&
                                 from_disk.value().messages.size() == 2,
                             "same suffix length");
                     require(from_cache.value().messages[0].uuid ==
                                 from_disk.value().messages[0].uuid,
                             "same anchor");

                     auto absent = manager.messages_from("s1", "nope");
                     require(absent.ok() && !absent.value().found, "absent anchor");
                   }});

  tests.push_back({"manager_save_title_and_delete", [] {
                     convlog::testing::ScopedRecorder recorder;
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     auto created = manager.create_session(std::string("draft"));
                     require(created.ok(), created.error());
                     const std::string id = created.value();

                     require(manager.update_session_title(id, "final").ok(), "rename");
                     auto metadata = manager.get_metadata(id);
                     require(metadata.ok() && metadata.value().title == "final", "title cached");
                     require(manager.update_metadata(id, h::MetadataPatch{.summary = "preview"}).ok(),
                             "patch");
                     auto listed = manager.list_sessions();
                     require(listed.ok() && listed.value().size() == 1, "listed");
                     require(listed.value()[0].summary == std::optional<std::string>("preview"),
                             "patched summary on disk");

                     std::vector<h::ConversationMessage> replacement{
                         manager.create_message(h::MessageType::User, "a", std::nullopt, id),
                         manager.create_message(h::MessageType::Assistant, "b", std::nullopt, id)};
                     require(manager.save_session(id, replacement).ok(), "save");
                     auto messages = manager.get_messages(id);
                     require(messages.ok() && messages.value().size() == 2, "saved content");

                     require(manager.delete_session(id).ok(), "delete");
                     require(manager.get_messages(id).code() == c::ErrorCode::NotFound,
                             "deleted session is gone");
                     require(manager.update_session_title(id, "x").code() ==
                                 c::ErrorCode::NotFound,
                             "rename after delete");
                     const auto sessions = recorder.events<convlog::observability::SessionEvent>();
                     require(sessions.size() == 3, "create, save, delete events");
                   }});

  tests.push_back({"manager_pretty_raw_json_stays_on_one_line", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     auto message =
                         manager.create_message(h::MessageType::Assistant, "done", std::nullopt, "s1");
                     message.message.usage = "{\n  \"input_tokens\": 10,\n  \"output_tokens\": 5\n}";
                     message.extra.emplace_back("costUSD", " 0.25 ");
                     require(manager.add_message("s1", message).ok(), "append pretty usage");

                     const std::string log = workspace.read_file("conversations/s1/messages.jsonl");
                     std::size_t newlines = 0;
                     for (const char ch : log) {
                       newlines += ch == '\n' ? 1 : 0;
                     }
                     require(newlines == 1, "one line on disk: " + log);

                     manager.clear_cache();
                     auto loaded = manager.load_session("s1");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().size() == 1, "message survives a cold load");
                     require(loaded.value()[0].message.usage ==
                                 std::optional<std::string>(R"({"input_tokens":10,"output_tokens":5})"),
                             "usage compacted");
                     auto metadata = manager.get_metadata("s1");
                     require(metadata.ok() && metadata.value().message_count == 1, "count is 1");
                   }});

  tests.push_back({"manager_rejects_malformed_raw_json", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     auto broken_usage =
                         manager.create_message(h::MessageType::Assistant, "a", std::nullopt, "s1");
                     broken_usage.message.usage = "{broken";
                     auto appended = manager.add_message("s1", broken_usage);
                     require(appended.code() == c::ErrorCode::InvalidArgument, "bad usage");
                     require(appended.error().find("usage") != std::string::npos, "names the field");

                     auto broken_extra =
                         manager.create_message(h::MessageType::User, "b", std::nullopt, "s1");
                     broken_extra.extra.emplace_back("k", "nope");
                     auto deduped = manager.add_message_with_deduplication("s1", broken_extra);
                     require(deduped.code() == c::ErrorCode::InvalidArgument, "bad extra");

                     auto broken_content =
                         manager.create_message(h::MessageType::User, "", std::nullopt, "s1");
                     broken_content.message.raw_content = "[1,";
                     auto saved = manager.save_session("s1", {broken_content});
                     require(saved.code() == c::ErrorCode::InvalidArgument, "bad content");

                     manager.clear_cache();
                     auto loaded = manager.load_session("s1");
                     require(loaded.ok() && loaded.value().empty(), "nothing written");
                     auto metadata = manager.get_metadata("s1");
                     require(metadata.ok() && metadata.value().message_count == 0, "count untouched");
                   }});

  tests.push_back({"manager_delete_drops_session_lock", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     for (const std::string id : {"a", "b"}) {
                       require(manager.create_session_with_id(id).ok(), "create " + id);
                       require(manager
                                   .add_message(id, manager.create_message(h::MessageType::User,
                                                                           "hi", std::nullopt, id))
                                   .ok(),
                               "append " + id);
                     }
                     require(manager.session_lock_count() == 2, "one lock per session");

                     require(manager.delete_session("a").ok(), "delete a");
                     require(manager.session_lock_count() == 1, "lock dropped with the session");

                     require(!manager.delete_session("../b").ok(), "invalid id");
                     require(manager.session_lock_count() == 1, "invalid id adds no lock");

                     require(manager
                                 .add_message("ghost", manager.create_message(
                                                           h::MessageType::User, "x",
                                                           std::nullopt, "ghost"))
                                 .code() == c::ErrorCode::NotFound,
                             "append to unknown session");
                     require(manager.session_lock_count() == 2, "append took a lock");
                     require(manager.delete_session("ghost").ok(), "deleting nothing succeeds");
                     require(manager.session_lock_count() == 1, "unknown session lock dropped");

                     require(manager.create_session_with_id("a").ok(), "recreate a");
                     require(manager
                                 .add_message("a", manager.create_message(h::MessageType::User,
                                                                          "again", std::nullopt, "a"))
                                 .ok(),
                             "append after recreate");
                     require(manager.session_lock_count() == 2, "fresh lock after recreate");
                   }});

  tests.push_back({"manager_concurrent_appends_are_serialized", [] {
                     convlog::testing::TempWorkspace workspace;
                     h::ConversationHistoryManager manager(
                         convlog::testing::history_options(workspace));
                     require(manager.create_session_with_id("s1").ok(), "create");

                     constexpr int THREADS = 4;
                     constexpr int PER_THREAD = 25;
                     std::vector<std::thread> workers;
                     std::vector<int> failures(THREADS, 0);
                     for (int t = 0; t < THREADS; ++t) {
                       workers.emplace_back([&manager, &failures, t] {
                         for (int i = 0; i < PER_THREAD; ++i) {
                           const auto message = manager.create_message(
                               h::MessageType::User,
                               "t" + std::to_string(t) + "-" + std::to_string(i), std::nullopt,
                               "s1");
                           if (!manager.add_message("s1", message).ok()) {
                             ++failures[static_cast<std::size_t>(t)];
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     for (const int count : failures) {
                       require(count == 0, "no append should fail");
                     }

                     auto disk = manager.load_session("s1");
                     require(disk.ok(), disk.error());
                     require(disk.value().size() == THREADS * PER_THREAD, "every line intact");
                     manager.clear_cache();
                     auto metadata = manager.get_metadata("s1");
                     require(metadata.ok() &&
                                 metadata.value().message_count == THREADS * PER_THREAD,
                             "count matches the log");
                   }});
}
