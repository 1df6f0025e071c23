// =================================================================
// include/CodeSharer/IgnorePattern.hpp
// =================================================================
// Header for gitignore-style pattern matching on project-relative paths.

#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace CodeSharer {

/**
 * @brief One gitignore-style pattern
 *
 * Supported syntax:
 * - Wildcards: *, **, ? and [...] classes
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Patterns containing a slash are anchored at the project root,
 *   others match the last path component at any depth
 * - Comment lines: # comment
 */
class IgnorePattern {
public:
    /**
     * @brief Compile a pattern line
     * @param pattern The raw line as found in an ignore file
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Path relative to the project root, '/' separated
     * @param is_directory True if the path names a directory
     * @return true if the pattern applies to the path
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if the line carried no pattern (blank, comment, invalid)
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::string m_original_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void compile(std::string pattern);

    /**
     * @brief Translate a glob body into an ECMAScript regex body
     */
    static std::string globToRegex(const std::string& glob);
};

/**
 * @brief Ordered collection of patterns; later patterns override earlier ones
 */
class IgnorePatternSet {
public:
    /**
     * @brief Add a pattern line; blank lines and comments are dropped
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Load every pattern line of an ignore file
     * @param file_path Path to the ignore file (e.g. .gitignore)
     * @return Number of patterns loaded, 0 if the file does not exist
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Check if a path is ignored by the last matching pattern
     * @param path Path relative to the project root
     * @param is_directory True if path names a directory
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }
    void clear() { m_patterns.clear(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace CodeSharer
