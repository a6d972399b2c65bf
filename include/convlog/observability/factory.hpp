#pragma once

#include "convlog/common/result.hpp"
#include "convlog/config/schema.hpp"
#include "convlog/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace convlog::observability {

enum class Backend {
  Log,
  Noop,
};

/// Parses "log", "none"/"noop" or a comma list of them. Case and blanks are ignored.
/// Unknown names fail with InvalidArgument. Repeats collapse; an empty list means Noop.
[[nodiscard]] common::Result<std::vector<Backend>> parse_backends(const std::string &backends);

/// Builds the observer for [observability].backend. An unparsable value falls back to logging.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace convlog::observability
