#include "tapbridge/directory/preferences.hpp"

#include "tapbridge/common/json_util.hpp"
#include "tapbridge/directory/http_util.hpp"

namespace tapbridge::directory {

StaticPreferencesStore::StaticPreferencesStore(security::AutoApprovalPreferences preferences)
    : preferences_(preferences) {
  preferences_.loaded = true;
}

common::Result<security::AutoApprovalPreferences> StaticPreferencesStore::get() {
  return common::Result<security::AutoApprovalPreferences>::success(preferences_);
}

HttpPreferencesStore::HttpPreferencesStore(std::shared_ptr<common::HttpClient> http,
                                           config::ApiConfig api)
    : http_(std::move(http)), api_(std::move(api)) {}

common::Result<security::AutoApprovalPreferences> HttpPreferencesStore::get() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_.has_value()) {
      return common::Result<security::AutoApprovalPreferences>::success(*cached_);
    }
  }
  auto fetched = fetch();
  if (fetched.ok()) {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = fetched.value();
  }
  return fetched;
}

common::Status HttpPreferencesStore::refresh() {
  auto fetched = fetch();
  if (!fetched.ok()) {
    return fetched.status();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cached_ = fetched.value();
  return common::Status::success();
}

common::Result<security::AutoApprovalPreferences> HttpPreferencesStore::fetch() {
  auto body = fetch_api_json(*http_, api_, "/api/settings/preferences");
  if (!body.ok()) {
    return common::Result<security::AutoApprovalPreferences>::failure(body.code(), body.error());
  }
  return parse_preferences_response(body.value());
}

common::Result<security::AutoApprovalPreferences>
parse_preferences_response(const std::string &body) {
  const std::string object = common::json_get_object(body, "preferences");
  if (object.empty()) {
    return common::Result<security::AutoApprovalPreferences>::failure(
        common::ErrorCode::MalformedEvent, "preferences response has no preferences object");
  }
  security::AutoApprovalPreferences preferences;
  preferences.auto_approve_low = common::json_get_bool(object, "autoApproveLow").value_or(false);
  preferences.auto_approve_medium =
      common::json_get_bool(object, "autoApproveMedium").value_or(false);
  preferences.auto_approve_high = common::json_get_bool(object, "autoApproveHigh").value_or(false);
  preferences.auto_approve_critical =
      common::json_get_bool(object, "autoApproveCritical").value_or(false);
  preferences.loaded = true;
  return common::Result<security::AutoApprovalPreferences>::success(preferences);
}

security::AutoApprovalPreferences preferences_from_config(const config::Config &config) {
  return security::AutoApprovalPreferences{
      .auto_approve_low = config.preferences.auto_approve_low,
      .auto_approve_medium = config.preferences.auto_approve_medium,
      .auto_approve_high = config.preferences.auto_approve_high,
      .auto_approve_critical = config.preferences.auto_approve_critical,
      .loaded = true,
  };
}

std::unique_ptr<IPreferencesStore>
create_preferences_store(const config::Config &config, std::shared_ptr<common::HttpClient> http) {
  if (config.preferences.source == "static") {
    return std::make_unique<StaticPreferencesStore>(preferences_from_config(config));
  }
  return std::make_unique<HttpPreferencesStore>(std::move(http), config.api);
}

} // namespace tapbridge::directory
