#pragma once

#include "tapbridge/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tapbridge::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Milliseconds since the unix epoch, the unit used for every wire and journal timestamp.
[[nodiscard]] std::int64_t to_unix_millis(std::chrono::system_clock::time_point point);
[[nodiscard]] std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
/// Accepts `YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)`.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string &text);
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point point);

} // namespace tapbridge::common
