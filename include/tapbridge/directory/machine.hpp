#pragma once

#include <optional>
#include <string>

namespace tapbridge::directory {

struct Machine {
  std::string id;
  std::string name;
  bool is_online = false;
  std::optional<std::string> tunnel_url;

  /// Online with a tunnel address; anything else is not reachable right now.
  [[nodiscard]] bool connectable() const {
    return is_online && tunnel_url.has_value() && !tunnel_url->empty();
  }
};

} // namespace tapbridge::directory
