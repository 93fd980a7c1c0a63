#include "tapbridge/directory/http_util.hpp"

namespace tapbridge::directory {

common::Result<std::string> fetch_api_json(common::HttpClient &http, const config::ApiConfig &api,
                                           const std::string &path) {
  std::string base = api.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  const std::string url = base + path;

  const auto response = http.get(url, common::bearer_headers(api.token), api.timeout_ms);
  if (response.network_error) {
    return common::Result<std::string>::failure(
        common::ErrorCode::NetworkError,
        (response.timeout ? "timed out: " : "request failed: ") + url + ": " +
            response.network_error_message);
  }
  if (response.status == 401 || response.status == 403) {
    return common::Result<std::string>::failure(common::ErrorCode::NetworkError,
                                                "not authorized for " + url +
                                                    " (check api.token)");
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::string>::failure(common::ErrorCode::NetworkError,
                                                "HTTP " + std::to_string(response.status) +
                                                    " from " + url);
  }
  return common::Result<std::string>::success(response.body);
}

} // namespace tapbridge::directory
