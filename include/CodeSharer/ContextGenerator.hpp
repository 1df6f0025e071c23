// =================================================================
// include/CodeSharer/ContextGenerator.hpp
// =================================================================
// Header for the walk, extract and assemble pipeline.

#pragma once

#include "CodeSharer/Errors.hpp"
#include "CodeSharer/FileTree.hpp"
#include "CodeSharer/ProjectConfig.hpp"
#include "CodeSharer/TargetSpec.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace CodeSharer {

class ProgressListener;

struct GenerationStats {
    size_t directories = 0;      ///< Directories in the structure
    size_t files_listed = 0;     ///< Files in the structure
    size_t files_included = 0;   ///< Code blocks with readable content
    size_t files_truncated = 0;
    size_t files_failed = 0;     ///< Code blocks replaced by an error notice
};

/**
 * @brief Output of one generation run
 */
struct GenerationResult {
    std::string document;
    std::vector<Issue> issues;
    GenerationStats stats;
    std::string project_root;
    std::optional<FileEntry> selected;
};

/**
 * @brief Produces the context document for a project or a single file
 *
 * The pipeline is sequential: walk the project, extract each file's text,
 * render the structure, assemble the document. Problems with individual
 * directories or files become Issues; only an unusable target or an invalid
 * configuration aborts the run.
 */
class ContextGenerator {
public:
    /**
     * @brief Construct a generator
     * @param config Configuration for every run of this generator
     */
    explicit ContextGenerator(ProjectConfig config);

    /**
     * @brief Attach a listener receiving directory, file and issue events
     * @param listener Listener, not owned; nullptr detaches
     */
    void setProgressListener(ProgressListener* listener);

    /**
     * @brief Keep one path out of the structure and the content
     *
     * Used for the output document so a previous run is never fed back in.
     */
    void setExcludedPath(const std::string& absolute_path);

    /**
     * @brief Generate the context document
     * @param target Directory or file to process
     * @param max_chars_override Character limit replacing the configured one
     * @param prompt Text placed verbatim in the PROMPT section
     * @return Document, collected issues and counters
     * @throws InvalidRootError if the target cannot be processed
     * @throws ConfigError if the character limit is 0
     */
    GenerationResult generateContext(const TargetSpec& target,
                                     std::optional<size_t> max_chars_override,
                                     const std::string& prompt) const;

    /**
     * @brief Write a document, replacing any previous content
     * @throws OutputWriteError if the file cannot be written
     */
    static void writeDocument(const std::string& path, const std::string& document);

    /**
     * @brief Find the project a file belongs to
     * @param file_path Path of the file
     * @param markers Entries identifying a project root, e.g. ".git"
     * @return Nearest ancestor directory holding a marker, else the
     *         file's own directory
     */
    static std::string resolveProjectRoot(const std::string& file_path,
                                          const std::vector<std::string>& markers);

    const ProjectConfig& config() const { return m_config; }

private:
    ProjectConfig m_config;
    ProgressListener* m_listener;
    std::string m_excluded_path;
};

} // namespace CodeSharer
