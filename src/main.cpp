/*
 * ctxkeep C++ - Context Budget Manager
 *
 * Keeps per-consumer AI context windows under their token budget by
 * archiving low-priority material and substituting extractive summaries.
 *
 * Usage:
 *   ./ctxkeep [--config config.json] < commands.txt
 */
#include <ctxkeep/core/application.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    ctxkeep::Application app;

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run(std::cin, std::cout);
    app.shutdown();

    return result;
}
