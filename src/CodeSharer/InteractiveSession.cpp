// =================================================================
// src/CodeSharer/InteractiveSession.cpp
// =================================================================
// Implementation for the line-oriented interactive front-end.

#include "CodeSharer/InteractiveSession.hpp"
#include "CodeSharer/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace CodeSharer {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

// "dir/.." normalizes to "parent/", drop the empty last element
std::string withoutTrailingSeparator(const fs::path& path) {
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        return path.parent_path().string();
    }
    return path.string();
}

} // namespace

InteractiveSession::InteractiveSession(const ContextGenerator& generator, std::string output_path,
                                       std::istream& in, std::ostream& out)
    : m_generator(generator), m_output_path(std::move(output_path)), m_in(in), m_out(out)
{
    m_state.project_path = fs::current_path().string();
    initializeKeyBindings();
}

void InteractiveSession::setProjectPath(const std::string& project_path) {
    m_state.project_path = withoutTrailingSeparator(fs::absolute(fs::path(project_path)).lexically_normal());
}

void InteractiveSession::setPrompt(const std::string& prompt) {
    m_state.prompt = prompt;
}

void InteractiveSession::setMaxChars(std::optional<size_t> max_chars) {
    m_max_chars = max_chars;
}

int InteractiveSession::run() {
    m_out << "CodeSharer interactive session" << std::endl;
    m_out << "Project: " << m_state.project_path << std::endl;
    m_out << "Shortcuts: g=generate, c=change directory, r=reset, q=quit, h=help" << std::endl;

    std::string line;
    while (true) {
        m_out << "\n> ";
        m_out.flush();
        if (!std::getline(m_in, line)) {
            m_out << std::endl;
            break;
        }
        if (!handleCommand(line)) {
            break;
        }
    }

    m_out << "Goodbye." << std::endl;
    return 0;
}

bool InteractiveSession::handleCommand(const std::string& line) {
    std::string input = trim(line);
    if (input.empty()) {
        return true;
    }

    size_t split = input.find_first_of(" \t");
    std::string word = input.substr(0, split);
    std::string argument = split == std::string::npos ? "" : trim(input.substr(split));

    switch (parseAction(word)) {
        case SessionAction::GENERATE:
            handleGenerate();
            break;
        case SessionAction::RESET:
            handleReset();
            break;
        case SessionAction::EXIT:
            return false;
        case SessionAction::CHANGE_DIRECTORY:
            handleChangeDirectory(argument);
            break;
        case SessionAction::SELECT_FILE:
            handleSelectFile(argument);
            break;
        case SessionAction::TOGGLE_MODE:
            handleToggleMode();
            break;
        case SessionAction::SET_PROMPT:
            handleSetPrompt(argument);
            break;
        case SessionAction::STATUS:
            displayStatus();
            break;
        case SessionAction::HELP:
            displayHelp();
            break;
        case SessionAction::UNKNOWN:
        default:
            m_out << "Unknown command '" << word << "'. Type 'h' for help." << std::endl;
            break;
    }
    return true;
}

SessionAction InteractiveSession::parseAction(const std::string& word) const {
    std::string key = word;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = m_key_bindings.find(key);
    return it != m_key_bindings.end() ? it->second : SessionAction::UNKNOWN;
}

void InteractiveSession::initializeKeyBindings() {
    m_key_bindings = {
        {"g", SessionAction::GENERATE},
        {"generate", SessionAction::GENERATE},
        {"r", SessionAction::RESET},
        {"reset", SessionAction::RESET},
        {"q", SessionAction::EXIT},
        {"quit", SessionAction::EXIT},
        {"exit", SessionAction::EXIT},
        {"esc", SessionAction::EXIT},
        {"c", SessionAction::CHANGE_DIRECTORY},
        {"cd", SessionAction::CHANGE_DIRECTORY},
        {"f", SessionAction::SELECT_FILE},
        {"file", SessionAction::SELECT_FILE},
        {"m", SessionAction::TOGGLE_MODE},
        {"mode", SessionAction::TOGGLE_MODE},
        {"p", SessionAction::SET_PROMPT},
        {"prompt", SessionAction::SET_PROMPT},
        {"s", SessionAction::STATUS},
        {"status", SessionAction::STATUS},
        {"h", SessionAction::HELP},
        {"help", SessionAction::HELP},
        {"?", SessionAction::HELP}
    };
}

void InteractiveSession::handleGenerate() {
    if (trim(m_state.prompt).empty()) {
        m_out << "Enter a prompt first: p <text>" << std::endl;
        return;
    }
    if (m_state.single_file_mode && m_state.selected_file.empty()) {
        m_out << "Single file mode is on but no file is selected: f <path>" << std::endl;
        return;
    }

    TargetSpec target;
    if (m_state.single_file_mode) {
        target.path = m_state.selected_file;
        target.mode = Mode::SINGLE_FILE;
        target.project_root = m_state.project_path;
    } else {
        target.path = m_state.project_path;
        target.mode = Mode::PROJECT;
    }

    m_out << "Generating context..." << std::endl;
    try {
        GenerationResult result = m_generator.generateContext(target, m_max_chars, m_state.prompt);
        ContextGenerator::writeDocument(m_output_path, result.document);
        ++m_state.generations;

        if (target.mode == Mode::SINGLE_FILE) {
            m_out << "Context for " << fs::path(target.path).filename().string()
                  << " written to " << m_output_path << std::endl;
        } else {
            m_out << "Context written to " << m_output_path << " ("
                  << result.stats.files_included << " files included)" << std::endl;
        }
        if (!result.issues.empty()) {
            m_out << result.issues.size() << " warning(s), see the WARNINGS section" << std::endl;
        }
    } catch (const ContextError& e) {
        LOG_ERROR("InteractiveSession", e.what());
        m_out << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR("InteractiveSession", std::string("Unexpected failure: ") + e.what());
        m_out << "Error: " << e.what() << std::endl;
    }
}

void InteractiveSession::handleReset() {
    m_state.selected_file.clear();
    m_state.single_file_mode = false;
    m_out << "Selection cleared, back to complete project mode" << std::endl;
}

void InteractiveSession::handleChangeDirectory(const std::string& argument) {
    if (argument.empty()) {
        m_out << "Usage: cd <directory>" << std::endl;
        return;
    }

    std::string path = resolveAgainstProject(argument);
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        m_out << "Not a directory: " << path << std::endl;
        return;
    }

    m_state.project_path = path;
    m_state.selected_file.clear();
    m_state.single_file_mode = false;
    m_out << "Directory selected: " << path << std::endl;
}

void InteractiveSession::handleSelectFile(const std::string& argument) {
    if (argument.empty()) {
        m_out << "Usage: file <path>" << std::endl;
        return;
    }

    std::string path = resolveAgainstProject(argument);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        m_out << "Not a file: " << path << std::endl;
        return;
    }

    fs::path rel = fs::path(path).lexically_relative(m_state.project_path);
    if (rel.empty() || *rel.begin() == "..") {
        m_out << "File is outside the project directory: " << path << std::endl;
        return;
    }

    m_state.selected_file = path;
    m_state.single_file_mode = true;
    m_out << "File selected: " << rel.generic_string() << std::endl;
}

void InteractiveSession::handleToggleMode() {
    m_state.single_file_mode = !m_state.single_file_mode;
    if (m_state.single_file_mode) {
        m_out << "Single file mode activated" << std::endl;
        if (m_state.selected_file.empty()) {
            m_out << "Select a file with: f <path>" << std::endl;
        }
    } else {
        m_state.selected_file.clear();
        m_out << "Complete project mode activated" << std::endl;
    }
}

void InteractiveSession::handleSetPrompt(const std::string& argument) {
    m_state.prompt = argument;
    if (argument.empty()) {
        m_out << "Prompt cleared" << std::endl;
    } else {
        m_out << "Prompt set" << std::endl;
    }
}

void InteractiveSession::displayStatus() const {
    m_out << "Project:  " << m_state.project_path << std::endl;
    m_out << "Mode:     " << modeName(m_state.single_file_mode ? Mode::SINGLE_FILE : Mode::PROJECT) << std::endl;
    m_out << "File:     " << (m_state.selected_file.empty() ? "(none)" : m_state.selected_file) << std::endl;
    m_out << "Prompt:   " << (m_state.prompt.empty() ? "(empty)" : m_state.prompt) << std::endl;
    m_out << "Output:   " << m_output_path << std::endl;
}

void InteractiveSession::displayHelp() const {
    m_out << "COMMANDS:" << std::endl;
    m_out << "  g/generate        - Generate the context document" << std::endl;
    m_out << "  r/reset           - Clear the selection, back to project mode" << std::endl;
    m_out << "  c/cd <dir>        - Change the project directory" << std::endl;
    m_out << "  f/file <path>     - Select a file (single file mode)" << std::endl;
    m_out << "  m/mode            - Toggle single file mode" << std::endl;
    m_out << "  p/prompt <text>   - Set the prompt" << std::endl;
    m_out << "  s/status          - Show the current settings" << std::endl;
    m_out << "  h/help/?          - Show this help" << std::endl;
    m_out << "  q/quit/exit/esc   - Leave the session" << std::endl;
}

std::string InteractiveSession::resolveAgainstProject(const std::string& argument) const {
    fs::path path(argument);
    if (path.is_relative()) {
        path = fs::path(m_state.project_path) / path;
    }
    return withoutTrailingSeparator(path.lexically_normal());
}

} // namespace CodeSharer
