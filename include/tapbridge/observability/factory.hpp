#pragma once

#include "tapbridge/config/schema.hpp"
#include "tapbridge/observability/observer.hpp"

#include <memory>
#include <string>

namespace tapbridge::observability {

/// Backend names: "log", "debug" (log including debug lines), "none"/"noop",
/// or a comma separated combination such as "log,none".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tapbridge::observability
