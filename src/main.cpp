#include "pushapk/cli/app.hpp"
#include "pushapk/core/logger.hpp"

auto main(int argc, char** argv) -> int {
    pushapk::cli::App app;
    auto rc = app.run(argc, argv);
    pushapk::Logger::flush();
    return rc;
}
