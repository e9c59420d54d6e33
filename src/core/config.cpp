#include "tgwire/core/config.hpp"
#include "tgwire/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace tgwire {

auto default_config() -> ApiConfig {
    return ApiConfig{};
}

auto load_config(const std::filesystem::path& path) -> ApiConfig {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            LOG_ERROR("Config root must be a JSON object: {}", path.string());
            return default_config();
        }
        return j.get<ApiConfig>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto apply_env_overrides(ApiConfig base) -> ApiConfig {
    if (auto* val = std::getenv("TGWIRE_API_HOST")) {
        base.host = val;
    }
    if (auto* val = std::getenv("TGWIRE_PATH_PREFIX")) {
        base.path_prefix = val;
    }
    if (auto* val = std::getenv("TGWIRE_LOG_LEVEL")) {
        base.log_level = val;
    }
    return base;
}

auto load_config_from_env() -> ApiConfig {
    return apply_env_overrides(default_config());
}

} // namespace tgwire
