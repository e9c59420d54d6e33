#pragma once

#include <CLI/CLI.hpp>

#include "tgwire/cli/commands.hpp"

namespace tgwire::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (encode, decode, kinds, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto context() -> CommandContext&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace tgwire::cli
