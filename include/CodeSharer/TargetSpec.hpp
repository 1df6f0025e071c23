// =================================================================
// include/CodeSharer/TargetSpec.hpp
// =================================================================
// What a generation run is pointed at.

#pragma once

#include <string>

namespace CodeSharer {

enum class Mode {
    PROJECT,        ///< Every eligible file of the project
    SINGLE_FILE     ///< One selected file, shown within the project structure
};

/**
 * @brief Path and mode of one generation run
 */
struct TargetSpec {
    std::string path;           ///< Project directory, or the selected file
    Mode mode = Mode::PROJECT;
    std::string project_root;   ///< Explicit project root for SINGLE_FILE, may be empty
};

inline std::string modeName(Mode mode) {
    return mode == Mode::SINGLE_FILE ? "Single file" : "Complete project";
}

} // namespace CodeSharer
