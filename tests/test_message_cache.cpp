#include "test_framework.hpp"

#include "convlog/history/message_cache.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <string>

namespace {

namespace h = convlog::history;

h::ConversationMessage cached_message(const std::string &uuid) {
  h::ConversationMessage message;
  message.uuid = uuid;
  message.session_id = "s1";
  message.message.role = "user";
  message.message.content = uuid;
  return message;
}

} // namespace

void register_message_cache_tests(std::vector<convlog::tests::TestCase> &tests) {
  using convlog::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"cache_messages_expire_after_ttl", [] {
                     convlog::testing::ManualClock clock;
                     h::MessageCache cache(1000ms, clock.clock());
                     require(!cache.get_messages("s1").has_value(), "empty cache misses");

                     cache.set_messages("s1", {cached_message("a")});
                     require(cache.is_valid("s1"), "fresh entry is valid");
                     clock.advance(999ms);
                     auto hit = cache.get_messages("s1");
                     require(hit.has_value() && hit->size() == 1, "still live before ttl");

                     clock.advance(1ms);
                     require(!cache.is_valid("s1"), "expired exactly at ttl");
                     require(!cache.get_messages("s1").has_value(), "expired entry misses");
                   }});

  tests.push_back({"cache_append_requires_live_entry", [] {
                     convlog::testing::ManualClock clock;
                     h::MessageCache cache(1000ms, clock.clock());
                     require(!cache.append_message("s1", cached_message("a")),
                             "append without an entry is refused");
                     require(!cache.get_messages("s1").has_value(), "refused append caches nothing");

                     cache.set_messages("s1", {});
                     require(cache.append_message("s1", cached_message("a")), "append to live");
                     require(cache.append_message("s1", cached_message("b")), "second append");
                     auto hit = cache.get_messages("s1");
                     require(hit.has_value() && hit->size() == 2, "both appended");
                     require((*hit)[1].uuid == "b", "append keeps order");

                     clock.advance(600ms);
                     require(cache.append_message("s1", cached_message("c")), "still live");
                     clock.advance(400ms);
                     require(!cache.is_valid("s1"), "appends do not extend the ttl");
                     require(!cache.append_message("s1", cached_message("d")),
                             "append after expiry is refused");
                   }});

  tests.push_back({"cache_metadata_expires_independently", [] {
                     convlog::testing::ManualClock clock;
                     h::MessageCache cache(1000ms, clock.clock());
                     cache.set_messages("s1", {});
                     clock.advance(500ms);
                     h::SessionMetadata metadata;
                     metadata.session_id = "s1";
                     metadata.message_count = 3;
                     cache.set_metadata("s1", metadata);

                     clock.advance(600ms);
                     require(!cache.is_valid("s1"), "messages expired");
                     auto meta = cache.get_metadata("s1");
                     require(meta.has_value() && meta->message_count == 3,
                             "metadata still live");
                     clock.advance(400ms);
                     require(!cache.get_metadata("s1").has_value(), "metadata expired");
                   }});

  tests.push_back({"cache_invalidate_and_stats", [] {
                     convlog::testing::ManualClock clock;
                     h::MessageCache cache(1000ms, clock.clock());
                     cache.set_messages("s1", {cached_message("a")});
                     cache.set_messages("s2", {});
                     h::SessionMetadata metadata;
                     metadata.session_id = "s2";
                     cache.set_metadata("s2", metadata);

                     (void)cache.get_messages("s1");
                     (void)cache.get_messages("s3");
                     (void)cache.get_metadata("s2");
                     auto stats = cache.stats();
                     require(stats.message_sessions == 2, "two message entries");
                     require(stats.metadata_sessions == 1, "one metadata entry");
                     require(stats.hits == 2 && stats.misses == 1, "hit/miss counters");

                     cache.invalidate("s1");
                     require(!cache.is_valid("s1"), "invalidated");
                     require(cache.is_valid("s2"), "other sessions untouched");
                     cache.invalidate_all();
                     stats = cache.stats();
                     require(stats.message_sessions == 0 && stats.metadata_sessions == 0,
                             "everything dropped");
                     require(cache.ttl() == 1000ms, "ttl reported");
                   }});

  tests.push_back({"cache_lookup_records_metric", [] {
                     convlog::testing::ScopedRecorder recorder;
                     h::MessageCache cache;
                     (void)cache.get_messages("s1");
                     cache.set_messages("s1", {});
                     (void)cache.get_messages("s1");
                     const auto lookups =
                         recorder.metrics<convlog::observability::CacheLookupMetric>();
                     require(lookups.size() == 2, "two lookups");
                     require(!lookups[0].hit && lookups[1].hit, "miss then hit");
                   }});
}
