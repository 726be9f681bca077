#include "dentassist/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    dentassist::cli::App app;
    return app.run(argc, argv);
}
