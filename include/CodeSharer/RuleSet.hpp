// =================================================================
// include/CodeSharer/RuleSet.hpp
// =================================================================
// Header for the immutable exclusion rules applied during traversal.

#pragma once

#include <cstddef>
#include <set>
#include <string>

namespace CodeSharer {

/**
 * @brief Exclusion sets and the per-file character limit
 *
 * A RuleSet is a value: it is built once from the configuration and then
 * only queried. Extensions are stored lower-cased with their leading dot,
 * so ".PY", "py" and ".py" all describe the same allowed extension.
 */
class RuleSet {
public:
    /**
     * @brief Construct a rule set
     * @param excluded_dirs Directory names skipped entirely (exact match)
     * @param excluded_files File names or extensions never included
     * @param allowed_extensions Extensions eligible for inclusion (empty = all)
     * @param max_chars_per_file Character budget per file, must be > 0
     * @throws std::invalid_argument if max_chars_per_file is 0
     */
    RuleSet(std::set<std::string> excluded_dirs,
            std::set<std::string> excluded_files,
            const std::set<std::string>& allowed_extensions,
            size_t max_chars_per_file);

    /**
     * @brief Check whether a directory name is excluded
     * @param name Directory name without any path component
     * @return true if the directory must not be listed or traversed
     */
    bool isDirectoryExcluded(const std::string& name) const;

    /**
     * @brief Check whether a file name survives the rules
     * @param name File name without any path component
     * @return true if the file may be listed and extracted
     */
    bool isFileIncluded(const std::string& name) const;

    /**
     * @brief Return a copy with a different character budget
     * @param max_chars_per_file New budget, must be > 0
     */
    RuleSet withMaxChars(size_t max_chars_per_file) const;

    const std::set<std::string>& excludedDirs() const { return m_excluded_dirs; }
    const std::set<std::string>& excludedFiles() const { return m_excluded_files; }
    const std::set<std::string>& allowedExtensions() const { return m_allowed_extensions; }
    size_t maxCharsPerFile() const { return m_max_chars_per_file; }

    /**
     * @brief Extract the lower-cased extension of a file name
     *
     * The extension is the suffix starting at the last dot. A dot in first
     * position does not start an extension, so ".gitignore" has none.
     *
     * @param name File name
     * @return Extension including the dot, or an empty string
     */
    static std::string extensionOf(const std::string& name);

    /**
     * @brief Normalize an extension to lower case with a leading dot
     * @param extension Raw extension ("py", ".PY"); empty stays empty
     */
    static std::string normalizeExtension(const std::string& extension);

private:
    std::set<std::string> m_excluded_dirs;
    std::set<std::string> m_excluded_files;
    std::set<std::string> m_excluded_extensions;
    std::set<std::string> m_allowed_extensions;
    size_t m_max_chars_per_file;
};

} // namespace CodeSharer
