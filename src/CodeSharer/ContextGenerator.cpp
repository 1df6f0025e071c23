// =================================================================
// src/CodeSharer/ContextGenerator.cpp
// =================================================================
// Implementation for the walk, extract and assemble pipeline.

#include "CodeSharer/ContextGenerator.hpp"
#include "CodeSharer/ContentExtractor.hpp"
#include "CodeSharer/DocumentAssembler.hpp"
#include "CodeSharer/Logger.hpp"
#include "CodeSharer/ProgressListener.hpp"
#include "CodeSharer/TreeWalker.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace CodeSharer {

ContextGenerator::ContextGenerator(ProjectConfig config)
    : m_config(std::move(config)), m_listener(nullptr)
{
}

void ContextGenerator::setProgressListener(ProgressListener* listener) {
    m_listener = listener;
}

void ContextGenerator::setExcludedPath(const std::string& absolute_path) {
    m_excluded_path = absolute_path;
}

GenerationResult ContextGenerator::generateContext(const TargetSpec& target,
                                                   std::optional<size_t> max_chars_override,
                                                   const std::string& prompt) const {
    RuleSet rules = m_config.toRuleSet();
    if (max_chars_override) {
        try {
            rules = rules.withMaxChars(*max_chars_override);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    std::error_code ec;
    fs::path target_path = fs::absolute(fs::path(target.path)).lexically_normal();
    std::string root;
    std::string selected_file;

    if (target.mode == Mode::SINGLE_FILE) {
        if (fs::is_directory(target_path, ec)) {
            throw InvalidRootError("Single-file mode needs a file, got a directory: " + target_path.string());
        }
        if (!fs::is_regular_file(target_path, ec)) {
            throw InvalidRootError("File does not exist: " + target_path.string());
        }
        root = target.project_root.empty()
                   ? resolveProjectRoot(target_path.string(), m_config.project_markers)
                   : target.project_root;
        selected_file = target_path.string();
    } else {
        root = target_path.string();
    }

    TreeWalker walker(rules);
    for (const auto& ignore_file : m_config.ignore_files) {
        walker.addIgnoreFile(ignore_file);
    }
    walker.setExcludedPath(m_excluded_path);
    walker.setProgressListener(m_listener);

    WalkResult walk = walker.walk(root, selected_file);

    GenerationResult result;
    result.issues = walk.issues;
    result.selected = walk.selected;
    result.stats.directories = walk.directory_count;
    result.stats.files_listed = walk.file_count;

    std::vector<FileEntry> files;
    if (target.mode == Mode::SINGLE_FILE) {
        files.push_back(*walk.selected);
    } else {
        files = collectFiles(walk.tree);
    }

    ContentExtractor extractor;
    std::vector<ExtractedContent> contents;
    contents.reserve(files.size());

    for (const auto& file : files) {
        ExtractedContent content;
        try {
            content = extractor.extract(file, rules.maxCharsPerFile());
        } catch (const ReadError& e) {
            LOG_WARNING("ContextGenerator", e.what());
            content = ExtractedContent::unreadable(file, e.reason());
            Issue issue(IssueKind::READ_ERROR, file.relative_path, e.reason());
            if (m_listener) {
                m_listener->onIssue(issue);
            }
            result.issues.push_back(std::move(issue));
        }

        if (content.decode_replaced) {
            Issue issue(IssueKind::DECODE_ERROR, file.relative_path,
                        "invalid UTF-8 replaced with U+FFFD");
            LOG_WARNING("ContextGenerator", "Invalid UTF-8 in " + file.relative_path);
            if (m_listener) {
                m_listener->onIssue(issue);
            }
            result.issues.push_back(std::move(issue));
        }

        if (content.readable()) {
            ++result.stats.files_included;
        } else {
            ++result.stats.files_failed;
        }
        if (content.truncated) {
            ++result.stats.files_truncated;
        }

        if (m_listener) {
            m_listener->onFile(file, content.truncated);
        }
        contents.push_back(std::move(content));
    }

    Logger::getInstance().logExtraction(contents.size(), result.stats.files_truncated,
                                        result.stats.files_failed);

    fs::path root_path = fs::absolute(fs::path(root)).lexically_normal();
    if (!root_path.has_filename() && root_path.has_parent_path() && root_path != root_path.root_path()) {
        root_path = root_path.parent_path();
    }
    result.project_root = root_path.string();

    DocumentInputs inputs;
    inputs.project_name = root_path.filename().string();
    inputs.root_path = result.project_root;
    inputs.mode = target.mode;
    inputs.tree = std::move(walk.tree);
    inputs.selected = walk.selected;
    inputs.contents = std::move(contents);
    inputs.issues = result.issues;
    inputs.prompt = prompt;

    DocumentAssembler assembler(m_config, rules);
    result.document = assembler.assemble(inputs);

    Logger::getInstance().info("ContextGenerator", "Generated context for " + result.project_root,
                               std::to_string(result.stats.files_included) + " files, " +
                               std::to_string(result.issues.size()) + " issues");
    return result;
}

void ContextGenerator::writeDocument(const std::string& path, const std::string& document) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::string reason = errno != 0 ? std::error_code(errno, std::generic_category()).message()
                                        : "cannot open file";
        throw OutputWriteError("Cannot write " + path + ": " + reason);
    }

    file << document;
    file.flush();
    if (!file.good()) {
        throw OutputWriteError("Cannot write " + path + ": I/O error");
    }

    LOG_DEBUG("ContextGenerator", "Wrote " + std::to_string(document.size()) + " bytes to " + path);
}

std::string ContextGenerator::resolveProjectRoot(const std::string& file_path,
                                                 const std::vector<std::string>& markers) {
    fs::path start = fs::absolute(fs::path(file_path)).lexically_normal().parent_path();

    std::error_code ec;
    for (fs::path dir = start; ; dir = dir.parent_path()) {
        for (const auto& marker : markers) {
            if (fs::exists(dir / marker, ec)) {
                LOG_DEBUG("ContextGenerator", "Project root " + dir.string() + " found by " + marker);
                return dir.string();
            }
        }
        if (dir == dir.root_path() || dir.parent_path() == dir) {
            break;
        }
    }

    return start.string();
}

} // namespace CodeSharer
