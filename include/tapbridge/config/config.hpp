#pragma once

#include "tapbridge/common/result.hpp"
#include "tapbridge/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace tapbridge::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tapbridge::config
