#include "bench_common.hpp"

#include "convlog/history/manager.hpp"

#include <filesystem>

void run_history_benchmark() {
  const auto root = std::filesystem::temp_directory_path() / "convlog-history-bench";
  std::error_code ec;
  std::filesystem::remove_all(root, ec);

  convlog::history::HistoryOptions options;
  options.root_dir = root;
  options.cwd = "/bench";
  convlog::history::ConversationHistoryManager manager(options);
  auto created = manager.create_session(std::string("bench"));
  if (!created.ok()) {
    std::cerr << "history bench: " << created.error() << "\n";
    return;
  }
  const std::string session_id = created.value();

  convlog::bench::run_bench("history_append", 1000, [&] {
    static int i = 0;
    const auto message = manager.create_message(convlog::history::MessageType::User,
                                                "benchmark payload " + std::to_string(i++),
                                                std::nullopt, session_id);
    (void)manager.add_message(session_id, message);
  });

  convlog::bench::run_bench("history_append_dedup", 200, [&] {
    static int i = 0;
    const auto message = manager.create_message(convlog::history::MessageType::Assistant,
                                                "dedup payload " + std::to_string(i++),
                                                std::nullopt, session_id);
    (void)manager.add_message_with_deduplication(session_id, message);
  });

  convlog::bench::run_bench("history_get_messages_cached", 200,
                            [&] { (void)manager.get_messages(session_id); });

  convlog::bench::run_bench("history_load_session_disk", 50,
                            [&] { (void)manager.load_session(session_id); });

  std::filesystem::remove_all(root, ec);
}
