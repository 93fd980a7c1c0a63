#include "tapbridge/directory/directory.hpp"

#include "tapbridge/common/fs.hpp"
#include "tapbridge/common/json_util.hpp"
#include "tapbridge/directory/http_util.hpp"

namespace tapbridge::directory {

StaticMachineDirectory::StaticMachineDirectory(std::vector<Machine> machines)
    : machines_(std::move(machines)) {}

common::Result<std::vector<Machine>> StaticMachineDirectory::list() {
  return common::Result<std::vector<Machine>>::success(machines_);
}

HttpMachineDirectory::HttpMachineDirectory(std::shared_ptr<common::HttpClient> http,
                                           config::ApiConfig api)
    : http_(std::move(http)), api_(std::move(api)) {}

common::Result<std::vector<Machine>> HttpMachineDirectory::list() {
  auto body = fetch_api_json(*http_, api_, "/api/machines");
  if (!body.ok()) {
    return common::Result<std::vector<Machine>>::failure(body.code(), body.error());
  }
  return parse_machines_response(body.value());
}

common::Result<std::vector<Machine>> parse_machines_response(const std::string &body) {
  const std::string array = common::json_get_array(body, "machines");
  if (array.empty()) {
    return common::Result<std::vector<Machine>>::failure(common::ErrorCode::MalformedEvent,
                                                         "machines response has no machines array");
  }

  std::vector<Machine> machines;
  for (const auto &entry : common::json_split_top_level_objects(array)) {
    Machine machine;
    machine.id = common::json_get_string(entry, "id");
    if (machine.id.empty()) {
      continue;
    }
    machine.name = common::json_get_string(entry, "name");
    machine.is_online = common::json_get_bool(entry, "isOnline").value_or(false);
    machine.tunnel_url = common::json_get_optional_string(entry, "tunnelUrl");
    machines.push_back(std::move(machine));
  }
  return common::Result<std::vector<Machine>>::success(std::move(machines));
}

std::vector<Machine> machines_from_config(const config::Config &config) {
  std::vector<Machine> machines;
  machines.reserve(config.machines.size());
  for (const auto &entry : config.machines) {
    Machine machine;
    machine.id = entry.id;
    machine.name = entry.name.empty() ? entry.id : entry.name;
    machine.is_online = entry.online;
    if (!common::trim(entry.tunnel_url).empty()) {
      machine.tunnel_url = common::trim(entry.tunnel_url);
    }
    machines.push_back(std::move(machine));
  }
  return machines;
}

std::unique_ptr<IMachineDirectory>
create_machine_directory(const config::Config &config, std::shared_ptr<common::HttpClient> http) {
  if (config.directory.source == "static") {
    return std::make_unique<StaticMachineDirectory>(machines_from_config(config));
  }
  return std::make_unique<HttpMachineDirectory>(std::move(http), config.api);
}

} // namespace tapbridge::directory
