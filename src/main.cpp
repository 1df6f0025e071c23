#include "CodeSharer/CliParser.hpp"
#include "CodeSharer/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments
    // using the CLI11 library.
    CodeSharer::CliParser parser;
    auto app = parser.setupCli();

    // CLI11's exit exceptions (help, parse errors) are turned into
    // an exit code here.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core dispatches between init, interactive and one-shot generation.
    CodeSharer::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
