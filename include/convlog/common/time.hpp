#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace convlog::common {

using Timestamp = std::chrono::system_clock::time_point;

/// UTC timestamp with millisecond precision, e.g. 2024-05-01T10:00:00.123Z.
[[nodiscard]] std::string format_iso8601(Timestamp time);
[[nodiscard]] std::string now_iso8601();

/// Accepts "YYYY-MM-DDTHH:MM:SS", optional fractional seconds, and a "Z" or +hh:mm offset.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string &value);

/// Local wall-clock time for human-facing labels ("2024-05-01 10:00:00").
[[nodiscard]] std::string local_datetime_label(Timestamp time);

} // namespace convlog::common
