#pragma once

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "tgwire/core/config.hpp"

namespace tgwire::cli {

/// State shared by all subcommands. Global options fill the first two
/// members during parsing; the effective configuration is resolved on
/// first use so that subcommand callbacks see the parsed values.
struct CommandContext {
    std::string config_path;
    std::string log_level;
    std::optional<ApiConfig> resolved;

    /// Loads the config file (or defaults), applies the environment and
    /// the --log-level override, and initialises the logger.
    auto config() -> const ApiConfig&;
};

/// Register the `encode` subcommand.
/// Assembles a request from a JSON parameter object and prints the
/// address and body.
void register_encode_command(CLI::App& app, CommandContext& ctx);

/// Register the `decode` subcommand.
/// Resolves a JSON value against a named union kind.
void register_decode_command(CLI::App& app, CommandContext& ctx);

/// Register the `kinds` subcommand.
void register_kinds_command(CLI::App& app);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace tgwire::cli
