#pragma once

#include "tapbridge/common/http.hpp"
#include "tapbridge/common/result.hpp"
#include "tapbridge/config/schema.hpp"
#include "tapbridge/security/approval.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tapbridge::directory {

/// Read-only source of the user's auto-approval preferences.
class IPreferencesStore {
public:
  virtual ~IPreferencesStore() = default;

  [[nodiscard]] virtual common::Result<security::AutoApprovalPreferences> get() = 0;
  [[nodiscard]] virtual common::Status refresh() { return common::Status::success(); }
};

class StaticPreferencesStore final : public IPreferencesStore {
public:
  explicit StaticPreferencesStore(security::AutoApprovalPreferences preferences);

  [[nodiscard]] common::Result<security::AutoApprovalPreferences> get() override;

private:
  security::AutoApprovalPreferences preferences_;
};

/// `GET {base_url}/api/settings/preferences`. The first successful response is cached
/// until refresh() fetches a new one.
class HttpPreferencesStore final : public IPreferencesStore {
public:
  HttpPreferencesStore(std::shared_ptr<common::HttpClient> http, config::ApiConfig api);

  [[nodiscard]] common::Result<security::AutoApprovalPreferences> get() override;
  [[nodiscard]] common::Status refresh() override;

private:
  [[nodiscard]] common::Result<security::AutoApprovalPreferences> fetch();

  std::shared_ptr<common::HttpClient> http_;
  config::ApiConfig api_;
  std::mutex mutex_;
  std::optional<security::AutoApprovalPreferences> cached_;
};

/// Decodes `{"preferences":{"autoApproveLow":..., ...}}`; absent flags read as false.
[[nodiscard]] common::Result<security::AutoApprovalPreferences>
parse_preferences_response(const std::string &body);

[[nodiscard]] security::AutoApprovalPreferences preferences_from_config(const config::Config &config);

[[nodiscard]] std::unique_ptr<IPreferencesStore>
create_preferences_store(const config::Config &config, std::shared_ptr<common::HttpClient> http);

} // namespace tapbridge::directory
