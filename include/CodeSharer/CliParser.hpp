// =================================================================
// include/CodeSharer/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace CodeSharer {

// Parsed command-line settings.
struct Commands {
    std::string path = ".";         // Project directory or file to process
    std::string output;             // Empty means the configured output
    std::string prompt;
    bool prompt_given = false;      // --prompt was passed, possibly empty
    size_t max_chars = 0;
    bool max_chars_given = false;
    bool single_file = false;
    std::string project_root;
    std::string config_path;

    bool interactive = false;
    bool init = false;

    // Logging
    bool verbose = false;
    bool quiet = false;
    std::string log_dir;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupTargetOptions(CLI::App& app);
    void setupModeOptions(CLI::App& app);
    void setupLoggingOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
    CLI::Option* m_prompt_option = nullptr;
    CLI::Option* m_max_chars_option = nullptr;
};

} // namespace CodeSharer
