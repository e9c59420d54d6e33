#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tgwire {

using json = nlohmann::json;

/// Where and how requests are addressed. The endpoint for a call is
/// `https://<host>/<path_prefix><token>/<method>`.
struct ApiConfig {
    std::string host = "api.telegram.org";  // may carry a ":port" suffix
    std::string path_prefix = "bot";
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ApiConfig, host, path_prefix, log_level)

auto default_config() -> ApiConfig;

/// Loads a JSON config file. A missing or malformed file yields the
/// defaults (with a warning); keys not present keep their defaults.
auto load_config(const std::filesystem::path& path) -> ApiConfig;

/// Applies TGWIRE_API_HOST, TGWIRE_PATH_PREFIX and TGWIRE_LOG_LEVEL on
/// top of `base`.
auto apply_env_overrides(ApiConfig base) -> ApiConfig;

/// Defaults overlaid with the environment.
auto load_config_from_env() -> ApiConfig;

} // namespace tgwire
