// =================================================================
// include/CodeSharer/InteractiveSession.hpp
// =================================================================
// Header for the line-oriented interactive front-end.

#pragma once

#include "CodeSharer/ContextGenerator.hpp"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

namespace CodeSharer {

/**
 * @brief Commands understood by the interactive session
 */
enum class SessionAction {
    GENERATE,           ///< Generate the context with the current prompt
    RESET,              ///< Clear the selection, back to project mode
    EXIT,               ///< Leave the session
    CHANGE_DIRECTORY,   ///< Switch to another project directory
    SELECT_FILE,        ///< Select a file, enabling single-file mode
    TOGGLE_MODE,        ///< Switch between project and single-file mode
    SET_PROMPT,         ///< Replace the prompt
    STATUS,             ///< Show the current settings
    HELP,               ///< Show the key bindings
    UNKNOWN
};

/**
 * @brief What the next generation will work on
 */
struct SessionState {
    std::string project_path;
    std::string selected_file;      ///< Absolute path, empty when nothing is selected
    bool single_file_mode = false;
    std::string prompt;
    size_t generations = 0;         ///< Documents written during the session
};

/**
 * @brief Terminal session driving a ContextGenerator
 *
 * Reads one command per line, e.g. "cd src", "file main.cpp",
 * "prompt Explain the parser" or "g". End of input leaves the session.
 * A failed generation is reported and the session continues.
 */
class InteractiveSession {
public:
    /**
     * @brief Construct a session
     * @param generator Generator used for every generation, not owned
     * @param output_path Document written on each generation
     * @param in Command source
     * @param out Destination of all session messages
     */
    InteractiveSession(const ContextGenerator& generator, std::string output_path,
                       std::istream& in = std::cin, std::ostream& out = std::cout);

    void setProjectPath(const std::string& project_path);
    void setPrompt(const std::string& prompt);
    void setMaxChars(std::optional<size_t> max_chars);

    /**
     * @brief Run until the user exits or input ends
     * @return Exit code, 0 on a normal exit
     */
    int run();

    /**
     * @brief Execute one command line
     * @param line Raw input line
     * @return false when the session should end
     */
    bool handleCommand(const std::string& line);

    /**
     * @brief Map a command word to its action
     * @param word First word of an input line, any case
     */
    SessionAction parseAction(const std::string& word) const;

    const SessionState& state() const { return m_state; }

private:
    const ContextGenerator& m_generator;
    std::string m_output_path;
    std::istream& m_in;
    std::ostream& m_out;
    std::optional<size_t> m_max_chars;
    SessionState m_state;
    std::unordered_map<std::string, SessionAction> m_key_bindings;

    void initializeKeyBindings();

    void handleGenerate();
    void handleReset();
    void handleChangeDirectory(const std::string& argument);
    void handleSelectFile(const std::string& argument);
    void handleToggleMode();
    void handleSetPrompt(const std::string& argument);

    void displayStatus() const;
    void displayHelp() const;

    std::string resolveAgainstProject(const std::string& argument) const;
};

} // namespace CodeSharer
