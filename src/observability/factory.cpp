#include "tapbridge/observability/factory.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/observability/log_observer.hpp"
#include "tapbridge/observability/multi_observer.hpp"
#include "tapbridge/observability/noop_observer.hpp"

#include <sstream>

namespace tapbridge::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>(LogLevel::Info);
  }
  if (name == "debug") {
    return std::make_unique<LogObserver>(LogLevel::Debug);
  }
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (normalized.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(normalized);
    std::string part;
    while (std::getline(stream, part, ',')) {
      multi->add(create_single(common::trim(part)));
    }
    return multi;
  }

  if (auto single = create_single(normalized); single != nullptr) {
    return single;
  }
  // Unknown names fall back to plain logging so misconfiguration stays visible.
  return std::make_unique<LogObserver>(LogLevel::Info);
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config.observability.backend);
}

} // namespace tapbridge::observability
