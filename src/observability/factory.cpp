#include "convlog/observability/factory.hpp"

#include "convlog/common/fs.hpp"
#include "convlog/observability/log_observer.hpp"
#include "convlog/observability/multi_observer.hpp"
#include "convlog/observability/noop_observer.hpp"

#include <algorithm>
#include <sstream>

namespace convlog::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const Backend backend) {
  switch (backend) {
  case Backend::Log:
    return std::make_unique<LogObserver>();
  case Backend::Noop:
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

common::Result<std::vector<Backend>> parse_backends(const std::string &backends) {
  std::vector<Backend> out;
  std::stringstream stream(common::to_lower(backends));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name.empty()) {
      continue;
    }
    Backend backend = Backend::Noop;
    if (name == "log") {
      backend = Backend::Log;
    } else if (name != "none" && name != "noop") {
      return common::Result<std::vector<Backend>>::failure(
          "Unknown observability backend: " + name, common::ErrorCode::InvalidArgument);
    }
    // Repeats collapse so "log,log" does not print every line twice.
    if (std::find(out.begin(), out.end(), backend) == out.end()) {
      out.push_back(backend);
    }
  }
  if (out.empty()) {
    out.push_back(Backend::Noop);
  }
  return common::Result<std::vector<Backend>>::success(std::move(out));
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  auto backends = parse_backends(config.observability.backend);
  if (!backends.ok()) {
    return std::make_unique<LogObserver>();
  }
  if (backends.value().size() == 1) {
    return make_backend(backends.value().front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const Backend backend : backends.value()) {
    multi->add(make_backend(backend));
  }
  return multi;
}

} // namespace convlog::observability
