#include "codebox/observability/factory.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/observability/log_observer.hpp"
#include "codebox/observability/multi_observer.hpp"

#include <iostream>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace codebox::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &backend, LogLevel level) {
  if (backend == "noop" || backend == "none") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "log") {
    return std::make_unique<LogObserver>(std::cerr, level);
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  const LogLevel level = log_level_from_string(config.log_level);
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    std::vector<std::unique_ptr<IObserver>> selected;
    std::unordered_set<std::string> seen;
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      part = common::trim(part);
      if (part == "none") {
        part = "noop";
      }
      if (!seen.insert(part).second) {
        continue;
      }
      if (auto observer = make_backend(part, level); observer != nullptr) {
        selected.push_back(std::move(observer));
      }
    }
    if (selected.empty()) {
      return std::make_unique<LogObserver>(std::cerr, level);
    }
    if (selected.size() == 1) {
      return std::move(selected.front());
    }
    auto multi = std::make_unique<MultiObserver>();
    for (auto &observer : selected) {
      multi->add(std::move(observer));
    }
    return multi;
  }

  if (auto single = make_backend(backend, level); single != nullptr) {
    return single;
  }
  return std::make_unique<LogObserver>(std::cerr, level);
}

} // namespace codebox::observability
