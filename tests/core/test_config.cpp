#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "tgwire/core/config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* name) : name_(name) {}
    ~EnvGuard() { ::unsetenv(name_); }
    const char* name_;
};

} // namespace

TEST_CASE("default_config returns Bot API defaults", "[config]") {
    auto cfg = tgwire::default_config();
    CHECK(cfg.host == "api.telegram.org");
    CHECK(cfg.path_prefix == "bot");
    CHECK(cfg.log_level == "info");
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "tgwire_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "host": "tg.example.com:8443", "log_level": "debug" })";
    }

    auto cfg = tgwire::load_config(tmp);

    CHECK(cfg.host == "tg.example.com:8443");
    CHECK(cfg.log_level == "debug");
    // Non-specified fields keep defaults
    CHECK(cfg.path_prefix == "bot");

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = tgwire::load_config("/nonexistent/tgwire/config.json");
        CHECK(cfg.host == "api.telegram.org");
    }

    SECTION("malformed file") {
        auto tmp = fs::temp_directory_path() / "tgwire_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = tgwire::load_config(tmp);
        CHECK(cfg.host == "api.telegram.org");
        fs::remove(tmp);
    }

    SECTION("root is not an object") {
        auto tmp = fs::temp_directory_path() / "tgwire_array_config.json";
        {
            std::ofstream out(tmp);
            out << "[1, 2, 3]";
        }
        auto cfg = tgwire::load_config(tmp);
        CHECK(cfg.path_prefix == "bot");
        fs::remove(tmp);
    }
}

TEST_CASE("apply_env_overrides reads TGWIRE_ variables", "[config]") {
    EnvGuard host("TGWIRE_API_HOST");
    EnvGuard prefix("TGWIRE_PATH_PREFIX");
    EnvGuard level("TGWIRE_LOG_LEVEL");

    ::setenv("TGWIRE_API_HOST", "localhost:8081", 1);
    ::setenv("TGWIRE_LOG_LEVEL", "trace", 1);
    ::unsetenv("TGWIRE_PATH_PREFIX");

    auto cfg = tgwire::apply_env_overrides(tgwire::default_config());
    CHECK(cfg.host == "localhost:8081");
    CHECK(cfg.log_level == "trace");
    CHECK(cfg.path_prefix == "bot");

    auto from_env = tgwire::load_config_from_env();
    CHECK(from_env.host == "localhost:8081");
}

TEST_CASE("ApiConfig JSON round trip", "[config]") {
    tgwire::ApiConfig cfg{.host = "h.example", .path_prefix = "b", .log_level = "warn"};
    nlohmann::json j = cfg;
    CHECK(j["host"] == "h.example");
    auto back = j.get<tgwire::ApiConfig>();
    CHECK(back.host == "h.example");
    CHECK(back.path_prefix == "b");
    CHECK(back.log_level == "warn");
}
