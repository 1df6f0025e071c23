// =================================================================
// include/CodeSharer/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "CodeSharer/CliParser.hpp"
#include "CodeSharer/ProjectConfig.hpp"
#include "CodeSharer/TargetSpec.hpp"
#include <string>

namespace CodeSharer {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the application based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleGenerate(const ProjectConfig& config);
    int handleInteractive(const ProjectConfig& config);

    void configureLogging();
    TargetSpec buildTarget() const;
    std::string outputPath(const ProjectConfig& config) const;

    // Reads one line from standard input; end of input gives an empty prompt
    std::string readPrompt() const;

    const Commands& m_commands;
};

} // namespace CodeSharer
