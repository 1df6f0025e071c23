// =================================================================
// src/CodeSharer/TreeWalker.cpp
// =================================================================
// Implementation for project traversal and filtering.

#include "CodeSharer/TreeWalker.hpp"
#include "CodeSharer/Logger.hpp"
#include "CodeSharer/ProgressListener.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace fs = std::filesystem;

namespace CodeSharer {

struct TreeWalker::WalkState {
    fs::path root;
    fs::path canonical_root;
    IgnorePatternSet ignore;
    std::string selected_rel;  // Empty when nothing is selected
    WalkResult result;

    bool isOnSelectedPath(const std::string& rel_dir) const {
        return !selected_rel.empty() &&
               selected_rel.size() > rel_dir.size() &&
               selected_rel.compare(0, rel_dir.size(), rel_dir) == 0 &&
               selected_rel[rel_dir.size()] == '/';
    }
};

namespace {

fs::path normalizedAbsolute(const std::string& path) {
    fs::path abs = fs::absolute(fs::path(path)).lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

std::string joinRelative(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

bool isInside(const fs::path& candidate, const fs::path& root) {
    fs::path rel = candidate.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

} // namespace

TreeWalker::TreeWalker(RuleSet rules)
    : m_rules(std::move(rules)), m_listener(nullptr)
{
}

void TreeWalker::addIgnorePattern(const std::string& pattern) {
    m_ignore_patterns.push_back(pattern);
}

void TreeWalker::addIgnoreFile(const std::string& file_name) {
    m_ignore_files.push_back(file_name);
}

void TreeWalker::setExcludedPath(const std::string& absolute_path) {
    m_excluded_path = absolute_path.empty() ? fs::path() : normalizedAbsolute(absolute_path);
}

void TreeWalker::setProgressListener(ProgressListener* listener) {
    m_listener = listener;
}

WalkResult TreeWalker::walk(const std::string& root_path, const std::string& selected_file) const {
    WalkState state;
    state.root = normalizedAbsolute(root_path);

    std::error_code ec;
    if (!fs::is_directory(state.root, ec)) {
        if (!fs::exists(state.root, ec)) {
            throw InvalidRootError("Path does not exist: " + state.root.string());
        }
        throw InvalidRootError("Project root is not a directory: " + state.root.string());
    }

    state.canonical_root = fs::weakly_canonical(state.root, ec);
    if (ec) {
        state.canonical_root = state.root;
    }

    if (!selected_file.empty()) {
        fs::path selected = normalizedAbsolute(selected_file);
        if (!fs::is_regular_file(selected, ec)) {
            throw InvalidRootError("Selected file does not exist: " + selected.string());
        }
        if (!isInside(selected, state.root)) {
            throw InvalidRootError("Selected file " + selected.string() +
                                   " is outside the project root " + state.root.string());
        }

        fs::path rel = selected.lexically_relative(state.root);
        for (auto it = rel.begin(); it != rel.end() && std::next(it) != rel.end(); ++it) {
            if (m_rules.isDirectoryExcluded(it->string())) {
                throw InvalidRootError("Selected file lies in excluded directory '" +
                                       it->string() + "'");
            }
        }
        state.selected_rel = rel.generic_string();
    }

    for (const auto& pattern : m_ignore_patterns) {
        state.ignore.addPattern(pattern);
    }
    for (const auto& file_name : m_ignore_files) {
        size_t loaded = state.ignore.loadFromFile((state.root / file_name).string());
        if (loaded > 0) {
            LOG_INFO("TreeWalker", "Loaded " + file_name + " with " + std::to_string(loaded) + " patterns");
        }
    }

    state.result.tree.name = state.root.filename().string();
    LOG_DEBUG("TreeWalker", "Walking " + state.root.string());
    walkDirectory(state.root, state.result.tree, state);

    if (!state.selected_rel.empty() && !state.result.selected) {
        throw InvalidRootError("Selected file is not reachable from the project root: " +
                               state.selected_rel);
    }

    state.result.directory_count = countDirectories(state.result.tree);
    state.result.file_count = countFiles(state.result.tree);
    Logger::getInstance().logWalkSummary(state.result.directory_count,
                                         state.result.file_count,
                                         state.result.issues.size());

    return std::move(state.result);
}

void TreeWalker::walkDirectory(const fs::path& abs_dir, DirEntry& node, WalkState& state,
                               bool selection_only) const {
    std::error_code ec;
    fs::directory_iterator it(abs_dir, ec);
    if (ec) {
        recordListingFailure(node, ec, state);
        return;
    }

    std::vector<std::pair<std::string, fs::path>> subdirs;
    std::vector<std::pair<std::string, fs::path>> files;

    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();

        std::error_code status_ec;
        fs::file_status link_status = entry.symlink_status(status_ec);
        if (status_ec) {
            LOG_DEBUG("TreeWalker", "Cannot stat " + entry.path().string() + ": " + status_ec.message());
            continue;
        }

        if (fs::is_symlink(link_status)) {
            fs::file_status target = entry.status(status_ec);
            if (status_ec || fs::is_directory(target)) {
                LOG_DEBUG("TreeWalker", "Skipping symbolic link " + entry.path().string());
                continue;
            }
            if (!fs::is_regular_file(target)) {
                continue;
            }
            fs::path resolved = fs::weakly_canonical(entry.path(), status_ec);
            if (status_ec || !isInside(resolved, state.canonical_root)) {
                LOG_DEBUG("TreeWalker", "Skipping link leaving the project: " + entry.path().string());
                continue;
            }
            files.emplace_back(name, entry.path());
        } else if (fs::is_directory(link_status)) {
            subdirs.emplace_back(name, entry.path());
        } else if (fs::is_regular_file(link_status)) {
            files.emplace_back(name, entry.path());
        }
    }

    if (ec) {
        recordListingFailure(node, ec, state);
        return;
    }

    auto by_name = [](const std::pair<std::string, fs::path>& a,
                      const std::pair<std::string, fs::path>& b) {
        return nameLess(a.first, b.first);
    };
    std::sort(subdirs.begin(), subdirs.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    for (const auto& [name, path] : subdirs) {
        std::string rel = joinRelative(node.relative_path, name);

        if (m_rules.isDirectoryExcluded(name)) {
            LOG_DEBUG("TreeWalker", "Excluded directory: " + rel);
            continue;
        }
        bool on_selected_path = state.isOnSelectedPath(rel);
        bool ignored = selection_only || state.ignore.shouldIgnore(rel, true);
        if (ignored && !on_selected_path) {
            LOG_DEBUG("TreeWalker", "Ignored directory: " + rel);
            continue;
        }

        DirEntry child;
        child.name = name;
        child.relative_path = rel;
        if (m_listener) {
            m_listener->onDirectory(rel);
        }
        // An ignored directory holding the selection only shows the path to it
        walkDirectory(path, child, state, ignored);
        node.directories.push_back(std::move(child));
    }

    for (const auto& [name, path] : files) {
        std::string rel = joinRelative(node.relative_path, name);
        bool selected = !state.selected_rel.empty() && rel == state.selected_rel;

        if (!selected) {
            if (selection_only) {
                continue;
            }
            if (!m_excluded_path.empty() && path.lexically_normal() == m_excluded_path) {
                continue;
            }
            if (!m_rules.isFileIncluded(name) || state.ignore.shouldIgnore(rel, false)) {
                continue;
            }
        }

        FileEntry file;
        file.name = name;
        file.relative_path = rel;
        file.absolute_path = path.string();
        file.extension = RuleSet::extensionOf(name);
        file.is_selected = selected;

        if (selected) {
            state.result.selected = file;
        }
        node.files.push_back(std::move(file));
    }
}

void TreeWalker::recordListingFailure(DirEntry& node, const std::error_code& ec, WalkState& state) const {
    node.directories.clear();
    node.files.clear();
    node.access_denied = true;

    IssueKind kind = isPermissionError(ec) ? IssueKind::PERMISSION_DENIED : IssueKind::TRAVERSAL_ERROR;
    std::string path = node.relative_path.empty() ? "." : node.relative_path + "/";
    Issue issue(kind, path, ec.message());

    LOG_WARNING("TreeWalker", "Cannot list " + path + ": " + ec.message());
    if (m_listener) {
        m_listener->onIssue(issue);
    }
    state.result.issues.push_back(std::move(issue));
}

bool TreeWalker::nameLess(const std::string& a, const std::string& b) {
    auto lower_less = [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    };
    if (std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), lower_less)) {
        return true;
    }
    if (std::lexicographical_compare(b.begin(), b.end(), a.begin(), a.end(), lower_less)) {
        return false;
    }
    return a < b;
}

} // namespace CodeSharer
