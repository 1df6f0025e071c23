// =================================================================
// src/CodeSharer/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "CodeSharer/CliParser.hpp"

namespace CodeSharer {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "CodeSharer: collects a project's structure and code into one markdown prompt.");

    // Record which optional values were actually given
    m_app->callback([this]() {
        m_commands.prompt_given = m_prompt_option->count() > 0;
        m_commands.max_chars_given = m_max_chars_option->count() > 0;
    });

    setupTargetOptions(*m_app);
    setupModeOptions(*m_app);
    setupLoggingOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupTargetOptions(CLI::App& app) {
    app.add_option("path", m_commands.path, "Project directory, or a file for single file mode (default: .)");
    app.add_option("-o,--output", m_commands.output, "Output markdown file (default: context.md)");
    m_max_chars_option = app.add_option("--max-chars", m_commands.max_chars,
                                        "Maximum characters per file (default: 10000)")
                             ->check(CLI::PositiveNumber);
    m_prompt_option = app.add_option("-p,--prompt", m_commands.prompt,
                                     "Prompt appended to the context; read from stdin when omitted");
    app.add_option("--project-root", m_commands.project_root,
                   "Project root used in single file mode")->check(CLI::ExistingDirectory);
    app.add_option("-c,--config", m_commands.config_path, "Configuration file (default: .codesharer.yml)");
}

void CliParser::setupModeOptions(CLI::App& app) {
    app.add_flag("-f,--file", m_commands.single_file, "Process only the file given as path");
    app.add_flag("-i,--interactive", m_commands.interactive, "Start an interactive session");
    app.add_flag("--init", m_commands.init, "Write a default .codesharer.yml and exit");
}

void CliParser::setupLoggingOptions(CLI::App& app) {
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Show debug output");
    auto* quiet = app.add_flag("-q,--quiet", m_commands.quiet, "Show only warnings and errors");
    verbose->excludes(quiet);
    app.add_option("--log-dir", m_commands.log_dir, "Also write log files to this directory");
}

} // namespace CodeSharer
