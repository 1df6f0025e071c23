// =================================================================
// include/CodeSharer/ProjectConfig.hpp
// =================================================================
// Configuration values consumed by the context pipeline.

#pragma once

#include "CodeSharer/RuleSet.hpp"
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace CodeSharer {

/**
 * @brief Settings for one generation run, usually read from .codesharer.yml
 *
 * Example file:
 * @code
 * skip_dirs: [.git, node_modules, build]
 * allowed_extensions: [.cpp, .hpp, .py]
 * max_chars_per_file: 8000
 * structure_max_depth: 4
 * language_tags:
 *   .qml: qml
 * @endcode
 *
 * Sequences replace the built-in defaults, language_tags are merged over
 * them. Unknown keys are ignored.
 */
struct ProjectConfig {
    // Traversal rules
    std::set<std::string> skip_dirs;
    std::set<std::string> skip_files;
    std::set<std::string> allowed_extensions;
    size_t max_chars_per_file = 10000;

    // Structure and project discovery
    size_t structure_max_depth = 0;
    std::vector<std::string> ignore_files;
    std::vector<std::string> project_markers;

    // Document
    std::map<std::string, std::string> language_tags;
    std::string output = "context.md";

    static constexpr const char* DEFAULT_CONFIG_FILE = ".codesharer.yml";
    static constexpr const char* FALLBACK_LANGUAGE_TAG = "text";

    /**
     * @brief Built-in defaults
     */
    static ProjectConfig defaults();

    /**
     * @brief Load a YAML configuration file over the defaults
     * @param config_path Path to the file
     * @return Loaded and validated configuration
     * @throws ConfigError if the file is missing, malformed or invalid
     */
    static ProjectConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Resolve the configuration the way the command line does
     * @param explicit_path Path given by the user, or empty to look for
     *        DEFAULT_CONFIG_FILE in the working directory
     * @return Loaded configuration, or defaults if no file applies
     * @throws ConfigError if an explicit file is missing or any file is invalid
     */
    static ProjectConfig resolve(const std::string& explicit_path);

    /**
     * @brief Check the settings
     * @return Human-readable problems, empty when the configuration is valid
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Build the rule set used by the walker
     * @throws ConfigError if the character limit is 0
     */
    RuleSet toRuleSet() const;

    /**
     * @brief Look up the syntax-highlighting tag for an extension
     * @param extension Extension with or without leading dot, any case
     * @return Configured tag, or FALLBACK_LANGUAGE_TAG
     */
    std::string languageTagFor(const std::string& extension) const;

    /**
     * @brief Serialize the configuration as a YAML document
     */
    std::string toYaml() const;

    static std::map<std::string, std::string> defaultLanguageTags();
};

} // namespace CodeSharer
