// =================================================================
// include/CodeSharer/Errors.hpp
// =================================================================
// Exception types for fatal failures and the Issue record used for
// problems that are reported but never abort a run.

#pragma once

#include <stdexcept>
#include <string>

namespace CodeSharer {

/**
 * @brief Base class of every fatal error raised by the context pipeline
 */
class ContextError : public std::runtime_error {
public:
    explicit ContextError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The target path is unusable (missing, wrong kind, outside the project)
 */
class InvalidRootError : public ContextError {
public:
    explicit InvalidRootError(const std::string& message) : ContextError(message) {}
};

/**
 * @brief The output document could not be written
 */
class OutputWriteError : public ContextError {
public:
    explicit OutputWriteError(const std::string& message) : ContextError(message) {}
};

/**
 * @brief The configuration file is missing, malformed or holds invalid values
 */
class ConfigError : public ContextError {
public:
    explicit ConfigError(const std::string& message) : ContextError(message) {}
};

/**
 * @brief A single file could not be opened or read
 *
 * Thrown by ContentExtractor; the ContextGenerator always catches it and
 * turns it into an inline error block.
 */
class ReadError : public ContextError {
public:
    ReadError(const std::string& path, const std::string& reason)
        : ContextError("Cannot read " + path + ": " + reason), m_path(path), m_reason(reason) {}

    const std::string& path() const { return m_path; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_path;
    std::string m_reason;
};

/**
 * @brief Kinds of non-fatal problems collected during a run
 */
enum class IssueKind {
    PERMISSION_DENIED,  ///< Directory or file not accessible
    TRAVERSAL_ERROR,    ///< Directory listing failed for another reason
    READ_ERROR,         ///< File content could not be read
    DECODE_ERROR        ///< File content held invalid UTF-8 that was replaced
};

/**
 * @brief A non-fatal problem, reported in the document's warning list
 */
struct Issue {
    IssueKind kind;
    std::string path;      ///< Path relative to the project root
    std::string message;

    Issue(IssueKind k, const std::string& p, const std::string& msg)
        : kind(k), path(p), message(msg) {}
};

/**
 * @brief Short identifier of an issue kind, e.g. "permission-denied"
 */
inline std::string issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::PERMISSION_DENIED: return "permission-denied";
        case IssueKind::TRAVERSAL_ERROR: return "traversal-error";
        case IssueKind::READ_ERROR: return "read-error";
        case IssueKind::DECODE_ERROR: return "decode-error";
        default: return "unknown";
    }
}

} // namespace CodeSharer
