#include "tgwire/cli/app.hpp"
#include "tgwire/core/logger.hpp"

// Version string; typically injected by CMake via -DTGWIRE_VERSION_STRING=...
#ifndef TGWIRE_VERSION_STRING
#define TGWIRE_VERSION_STRING "0.1.0-dev"
#endif

namespace tgwire::cli {

App::App()
    : cli_("tgwire", "Telegram Bot API wire codec")
{
    cli_.set_version_flag("--version", TGWIRE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("TGWIRE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        Logger::flush();
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already been invoked by
    // CLI11's parse().
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CommandContext& {
    return context_;
}

void App::setup_commands() {
    register_encode_command(cli_, context_);
    register_decode_command(cli_, context_);
    register_kinds_command(cli_);
    register_config_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace tgwire::cli
