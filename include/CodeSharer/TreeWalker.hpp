// =================================================================
// include/CodeSharer/TreeWalker.hpp
// =================================================================
// Header for project traversal and filtering.

#pragma once

#include "CodeSharer/Errors.hpp"
#include "CodeSharer/FileTree.hpp"
#include "CodeSharer/IgnorePattern.hpp"
#include "CodeSharer/RuleSet.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace CodeSharer {

class ProgressListener;

/**
 * @brief Outcome of one traversal pass
 */
struct WalkResult {
    DirEntry tree;                      ///< Rooted at the project root
    std::optional<FileEntry> selected;  ///< Set in single-file mode
    std::vector<Issue> issues;          ///< Non-fatal listing failures
    size_t directory_count = 0;
    size_t file_count = 0;
};

/**
 * @brief Walks a project directory and builds the filtered tree
 *
 * The walk is depth-first. Within a directory, subdirectories come first,
 * then files, each group sorted case-insensitively by name with ties broken
 * by exact byte order. Directories excluded by the RuleSet are neither
 * listed nor entered; directories left empty by filtering are kept.
 * Symbolic links to directories are skipped, symbolic links to files are
 * kept only when their target lies inside the project root.
 */
class TreeWalker {
public:
    /**
     * @brief Construct a walker
     * @param rules Exclusion rules applied to every entry
     */
    explicit TreeWalker(RuleSet rules);

    /**
     * @brief Add a gitignore-style pattern applied to root-relative paths
     * @param pattern Pattern line
     */
    void addIgnorePattern(const std::string& pattern);

    /**
     * @brief Name an ignore file to read from the project root on each walk
     * @param file_name File name such as ".gitignore"
     */
    void addIgnoreFile(const std::string& file_name);

    /**
     * @brief Exclude one absolute path from the listing (the output document)
     */
    void setExcludedPath(const std::string& absolute_path);

    /**
     * @brief Attach a listener receiving directory and issue events
     * @param listener Listener, not owned; nullptr detaches
     */
    void setProgressListener(ProgressListener* listener);

    /**
     * @brief Walk a project root
     * @param root_path Directory to walk
     * @param selected_file Optional file below root_path to mark as selected.
     *        It is listed even when file rules would reject it.
     * @return Filtered tree, selected entry and collected issues
     * @throws InvalidRootError if root_path is not a directory, or the
     *         selected file is missing, outside the root or below an
     *         excluded directory
     */
    WalkResult walk(const std::string& root_path, const std::string& selected_file = "") const;

private:
    struct WalkState;

    RuleSet m_rules;
    std::vector<std::string> m_ignore_patterns;
    std::vector<std::string> m_ignore_files;
    std::filesystem::path m_excluded_path;
    ProgressListener* m_listener;

    void walkDirectory(const std::filesystem::path& abs_dir, DirEntry& node, WalkState& state,
                       bool selection_only = false) const;

    void recordListingFailure(DirEntry& node, const std::error_code& ec, WalkState& state) const;

    static bool nameLess(const std::string& a, const std::string& b);
};

} // namespace CodeSharer
