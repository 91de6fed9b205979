#include "Tempo/CliParser.hpp"
#include "Tempo/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser owns the CLI11 definitions of every subcommand.
    Tempo::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports help and usage errors through exceptions.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core dispatches to the handler of the parsed subcommand.
    Tempo::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
