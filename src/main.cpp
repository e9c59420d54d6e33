#include "tgwire/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    tgwire::cli::App app;
    return app.run(argc, argv);
}
