#pragma once

#include "convlog/common/result.hpp"
#include "convlog/history/message.hpp"
#include "convlog/history/metadata.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace convlog::history {

/// Values stamped into the metadata of newly created sessions.
struct SessionDefaults {
  std::string version = "1.0.0";
  std::string user_type = "external";
  std::string cwd;
};

/// Messages of a log starting at a given uuid. `found` is false when the uuid is absent.
struct LogSuffix {
  bool found = false;
  std::vector<ConversationMessage> messages;
};

/// On-disk layout: <root>/<sessionId>/metadata.json and <root>/<sessionId>/messages.jsonl.
/// Pure file I/O; no caching and no locking.
class SessionStore {
public:
  explicit SessionStore(std::filesystem::path root_dir, SessionDefaults defaults = {});

  [[nodiscard]] static common::Status validate_session_id(const std::string &session_id);

  [[nodiscard]] common::Result<std::string>
  create_session(const std::optional<std::string> &title = std::nullopt);
  [[nodiscard]] common::Result<SessionMetadata>
  create_session_with_id(const std::string &session_id,
                         const std::optional<std::string> &title = std::nullopt);

  [[nodiscard]] common::Result<std::vector<ConversationMessage>>
  load_session(const std::string &session_id) const;
  [[nodiscard]] common::Status save_session(const std::string &session_id,
                                            const std::vector<ConversationMessage> &messages);
  [[nodiscard]] common::Status append_message(const std::string &session_id,
                                              const ConversationMessage &message);
  [[nodiscard]] common::Status delete_session(const std::string &session_id);
  [[nodiscard]] common::Result<std::vector<SessionMetadata>> list_sessions() const;

  [[nodiscard]] common::Result<SessionMetadata> load_metadata(const std::string &session_id) const;
  [[nodiscard]] common::Result<SessionMetadata> update_metadata(const std::string &session_id,
                                                                const MetadataPatch &patch);
  /// Read-modify-write of metadata.json. The mutator sees the current record.
  [[nodiscard]] common::Result<SessionMetadata>
  modify_metadata(const std::string &session_id,
                  const std::function<void(SessionMetadata &)> &mutator);

  /// Streams the log, collecting from the line whose uuid matches through the end.
  [[nodiscard]] common::Result<LogSuffix> read_log_from(const std::string &session_id,
                                                        const std::string &uuid) const;

  [[nodiscard]] bool session_exists(const std::string &session_id) const;
  [[nodiscard]] const std::filesystem::path &root_dir() const { return root_dir_; }
  [[nodiscard]] std::filesystem::path session_dir(const std::string &session_id) const;
  [[nodiscard]] std::filesystem::path log_path(const std::string &session_id) const;
  [[nodiscard]] std::filesystem::path metadata_path(const std::string &session_id) const;

private:
  [[nodiscard]] SessionMetadata default_metadata(const std::string &session_id,
                                                 const std::optional<std::string> &title) const;
  [[nodiscard]] common::Status write_metadata(const SessionMetadata &metadata) const;
  [[nodiscard]] common::Status require_session(const std::string &session_id) const;

  std::filesystem::path root_dir_;
  SessionDefaults defaults_;
};

} // namespace convlog::history
