#pragma once

#include "tapbridge/common/http.hpp"
#include "tapbridge/common/result.hpp"
#include "tapbridge/config/schema.hpp"
#include "tapbridge/directory/machine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tapbridge::directory {

class IMachineDirectory {
public:
  virtual ~IMachineDirectory() = default;

  [[nodiscard]] virtual common::Result<std::vector<Machine>> list() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Machines declared under `[machines.<id>]` in the config file.
class StaticMachineDirectory final : public IMachineDirectory {
public:
  explicit StaticMachineDirectory(std::vector<Machine> machines);

  [[nodiscard]] common::Result<std::vector<Machine>> list() override;
  [[nodiscard]] std::string_view name() const override { return "static"; }

private:
  std::vector<Machine> machines_;
};

/// `GET {base_url}/api/machines` with the account bearer token.
class HttpMachineDirectory final : public IMachineDirectory {
public:
  HttpMachineDirectory(std::shared_ptr<common::HttpClient> http, config::ApiConfig api);

  [[nodiscard]] common::Result<std::vector<Machine>> list() override;
  [[nodiscard]] std::string_view name() const override { return "api"; }

private:
  std::shared_ptr<common::HttpClient> http_;
  config::ApiConfig api_;
};

/// Decodes `{"machines":[{"id","name","isOnline","tunnelUrl"}, ...]}`.
[[nodiscard]] common::Result<std::vector<Machine>> parse_machines_response(const std::string &body);

[[nodiscard]] std::vector<Machine> machines_from_config(const config::Config &config);

[[nodiscard]] std::unique_ptr<IMachineDirectory>
create_machine_directory(const config::Config &config, std::shared_ptr<common::HttpClient> http);

} // namespace tapbridge::directory
