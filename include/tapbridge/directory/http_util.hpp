#pragma once

#include "tapbridge/common/http.hpp"
#include "tapbridge/common/result.hpp"
#include "tapbridge/config/schema.hpp"

#include <string>

namespace tapbridge::directory {

/// Authenticated GET against the account API; any non-2xx status is a failure.
[[nodiscard]] common::Result<std::string> fetch_api_json(common::HttpClient &http,
                                                         const config::ApiConfig &api,
                                                         const std::string &path);

} // namespace tapbridge::directory
