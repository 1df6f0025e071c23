// =================================================================
// src/CodeSharer/Core.cpp
// =================================================================
// Implementation of the core application orchestrator.

#include "CodeSharer/Core.hpp"
#include "CodeSharer/ContextGenerator.hpp"
#include "CodeSharer/Errors.hpp"
#include "CodeSharer/InteractiveSession.hpp"
#include "CodeSharer/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace CodeSharer {

Core::Core(const Commands& commands) : m_commands(commands) {}

int Core::run() {
    configureLogging();

    const std::string command = m_commands.init ? "init" : m_commands.interactive ? "interactive" : "generate";
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(command, m_commands.path);

    int exit_code = 1;
    try {
        if (m_commands.init) {
            exit_code = handleInit();
        } else {
            ProjectConfig config = ProjectConfig::resolve(m_commands.config_path);
            exit_code = m_commands.interactive ? handleInteractive(config) : handleGenerate(config);
        }
    } catch (const ContextError& e) {
        LOG_ERROR("Core", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logSessionEnd(command, exit_code, static_cast<long>(elapsed.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleInit() {
    const std::string path = m_commands.config_path.empty() ? ProjectConfig::DEFAULT_CONFIG_FILE
                                                            : m_commands.config_path;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::cerr << "Configuration file already exists: " << path << std::endl;
        return 1;
    }

    std::ofstream config_file(path);
    if (!config_file.is_open()) {
        throw ConfigError("Cannot create " + path);
    }
    config_file << ProjectConfig::defaults().toYaml();
    if (!config_file.good()) {
        throw ConfigError("Cannot write " + path);
    }

    std::cout << "Created " << path << std::endl;
    return 0;
}

int Core::handleGenerate(const ProjectConfig& config) {
    TargetSpec target = buildTarget();
    const std::string output = outputPath(config);
    std::string prompt = m_commands.prompt_given ? m_commands.prompt : readPrompt();

    std::optional<size_t> max_chars;
    if (m_commands.max_chars_given) {
        max_chars = m_commands.max_chars;
    }

    ContextGenerator generator(config);
    generator.setExcludedPath(fs::absolute(output).string());

    GenerationResult result = generator.generateContext(target, max_chars, prompt);
    ContextGenerator::writeDocument(output, result.document);

    if (target.mode == Mode::SINGLE_FILE && result.selected) {
        std::cout << "Context for " << result.selected->relative_path << " written to " << output << std::endl;
    } else {
        std::cout << "Context written to " << output << " (" << result.stats.files_included
                  << " files included)" << std::endl;
    }
    if (!result.issues.empty()) {
        std::cout << result.issues.size() << " warning(s), see the WARNINGS section" << std::endl;
    }
    return 0;
}

int Core::handleInteractive(const ProjectConfig& config) {
    const std::string output = outputPath(config);

    ContextGenerator generator(config);
    generator.setExcludedPath(fs::absolute(output).string());

    InteractiveSession session(generator, output);
    std::error_code ec;
    if (fs::is_regular_file(m_commands.path, ec)) {
        session.setProjectPath(m_commands.project_root.empty()
                                   ? ContextGenerator::resolveProjectRoot(m_commands.path, config.project_markers)
                                   : m_commands.project_root);
        session.handleCommand("file " + fs::absolute(m_commands.path).string());
    } else {
        session.setProjectPath(m_commands.path);
    }
    if (m_commands.prompt_given) {
        session.setPrompt(m_commands.prompt);
    }
    if (m_commands.max_chars_given) {
        session.setMaxChars(m_commands.max_chars);
    }

    return session.run();
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_commands.quiet) {
        logger.setConsoleLogLevel(LogLevel::WARNING);
    }
    if (!m_commands.log_dir.empty()) {
        logger.enableFileLogging(m_commands.log_dir);
    }
}

TargetSpec Core::buildTarget() const {
    TargetSpec target;
    target.path = m_commands.path;
    target.project_root = m_commands.project_root;

    std::error_code ec;
    if (m_commands.single_file || fs::is_regular_file(m_commands.path, ec)) {
        target.mode = Mode::SINGLE_FILE;
    }
    return target;
}

std::string Core::outputPath(const ProjectConfig& config) const {
    return m_commands.output.empty() ? config.output : m_commands.output;
}

std::string Core::readPrompt() const {
    if (isatty(STDIN_FILENO)) {
        std::cerr << "Prompt: " << std::flush;
    }

    std::string prompt;
    if (!std::getline(std::cin, prompt)) {
        prompt.clear();
    }
    return prompt;
}

} // namespace CodeSharer
