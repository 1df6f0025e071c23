// =================================================================
// include/CodeSharer/ProgressListener.hpp
// =================================================================
// Callback interface for front-ends that follow a generation run.

#pragma once

#include "CodeSharer/Errors.hpp"
#include "CodeSharer/FileTree.hpp"
#include <string>

namespace CodeSharer {

/**
 * @brief Receives progress events while a context is generated
 *
 * All methods have empty default implementations, so a front-end only
 * overrides the events it cares about. Events arrive in listing order.
 */
class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    /**
     * @brief A directory is about to be listed
     * @param relative_path Directory path relative to the project root
     */
    virtual void onDirectory(const std::string& relative_path) { (void)relative_path; }

    /**
     * @brief A file's content has been extracted (or failed to be)
     * @param entry The file
     * @param truncated Whether the content was cut to the character budget
     */
    virtual void onFile(const FileEntry& entry, bool truncated) { (void)entry; (void)truncated; }

    /**
     * @brief A non-fatal problem was recorded
     */
    virtual void onIssue(const Issue& issue) { (void)issue; }
};

} // namespace CodeSharer
