#include "tgwire/cli/commands.hpp"
#include "tgwire/core/logger.hpp"
#include "tgwire/core/utils.hpp"
#include "tgwire/request/api.hpp"
#include "tgwire/request/endpoint.hpp"
#include "tgwire/types/kinds.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef TGWIRE_VERSION_STRING
#define TGWIRE_VERSION_STRING "0.1.0-dev"
#endif

namespace tgwire::cli {

using json = nlohmann::json;

namespace {

/// Prints `err` to stderr and aborts the subcommand with exit code 1.
[[noreturn]] void fail(const Error& err) {
    LOG_DEBUG("Command failed: {}", error_code_to_string(err.code()));
    std::cerr << "error [" << error_code_to_string(err.code()) << "]: " << err.what() << "\n";
    throw CLI::RuntimeError(1);
}

auto parse_json_text(const std::string& text) -> Result<json> {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Invalid JSON", e.what()));
    }
}

auto read_json_file(const std::filesystem::path& path) -> Result<json> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Cannot open parameter file", path.string()));
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Invalid JSON in " + path.string(), e.what()));
    }
}

} // anonymous namespace

auto CommandContext::config() -> const ApiConfig& {
    if (!resolved) {
        ApiConfig cfg = config_path.empty()
            ? load_config_from_env()
            : apply_env_overrides(load_config(std::filesystem::path(config_path)));
        if (!log_level.empty()) {
            cfg.log_level = log_level;
        }
        Logger::init("tgwire", cfg.log_level);
        resolved = std::move(cfg);
    }
    return *resolved;
}

// ---------------------------------------------------------------------------
// encode command
// ---------------------------------------------------------------------------

void register_encode_command(CLI::App& app, CommandContext& ctx) {
    struct Options {
        std::string method;
        std::string params_file;
        std::string params_json;
        std::string token;
        bool show_token = false;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("encode", "Assemble a request body for a Bot API method");
    sub->add_option("method", opts->method, "Method name, e.g. sendMessage")->required();

    auto* file_opt = sub->add_option("-p,--params", opts->params_file,
                                     "JSON file holding the parameter object")
        ->check(CLI::ExistingFile);
    sub->add_option("-j,--json", opts->params_json, "Parameter object as inline JSON")
        ->excludes(file_opt);

    sub->add_option("-t,--token", opts->token, "Bot token")
        ->envname("TGWIRE_BOT_TOKEN");
    sub->add_flag("--show-token", opts->show_token,
                  "Print the address without masking the token");

    sub->callback([&ctx, opts]() {
        const auto& config = ctx.config();

        json raw = json::object();
        if (!opts->params_file.empty()) {
            auto loaded = read_json_file(opts->params_file);
            if (!loaded) fail(loaded.error());
            raw = std::move(*loaded);
        } else if (!opts->params_json.empty()) {
            auto parsed = parse_json_text(opts->params_json);
            if (!parsed) fail(parsed.error());
            raw = std::move(*parsed);
        }

        auto params = request::ParameterMap::from_json(raw);
        if (!params) fail(params.error());

        request::Api api(config, opts->token);
        auto call = api.prepare(utils::trim(opts->method), *params);
        if (!call) fail(call.error());

        auto address = opts->show_token ? call->address : api.redacted(call->address);
        std::cout << "POST " << address << "\n";
        std::cout << "Content-Type: " << request::kContentType << "\n\n";
        std::cout << call->request.body() << "\n";
    });
}

// ---------------------------------------------------------------------------
// decode command
// ---------------------------------------------------------------------------

void register_decode_command(CLI::App& app, CommandContext& ctx) {
    struct Options {
        std::string kind;
        std::string value;
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("decode", "Resolve a JSON value against a union kind");
    sub->add_option("kind", opts->kind, "Union kind name (see `tgwire kinds`)")->required();
    sub->add_option("json", opts->value, "JSON value to decode")->required();

    sub->callback([&ctx, opts]() {
        ctx.config();

        const auto* kind = types::find_kind(opts->kind);
        if (!kind) {
            fail(make_error(ErrorCode::InvalidArgument, "Unknown union kind", opts->kind));
        }

        auto parsed = parse_json_text(opts->value);
        if (!parsed) fail(parsed.error());

        auto resolved = kind->decode(*parsed);
        if (!resolved) fail(resolved.error());

        json out = {
            {"kind", std::string(kind->name)},
            {"index", resolved->index},
            {"alternative", resolved->alternative},
            {"value", resolved->value},
        };
        std::cout << out.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// kinds command
// ---------------------------------------------------------------------------

void register_kinds_command(CLI::App& app) {
    auto* sub = app.add_subcommand("kinds", "List union kinds and their candidate order");

    sub->callback([]() {
        for (const auto& kind : types::all_kinds()) {
            std::cout << kind.name << "\n";
            for (std::size_t i = 0; i < kind.candidates.size(); ++i) {
                std::cout << "  " << i << ". " << kind.candidates[i] << "\n";
            }
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        const auto& cfg = ctx.config();

        // The endpoint template must be well formed for a plausible token.
        auto probe = request::make_endpoint(cfg, "0:probe", "getMe");
        if (!probe) {
            fail(make_error(ErrorCode::InvalidConfig, "Configuration yields no valid endpoint",
                            std::string(probe.error().message())));
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = cfg;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "tgwire " << TGWIRE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace tgwire::cli
