// =================================================================
// src/CodeSharer/RuleSet.cpp
// =================================================================
// Implementation for the exclusion rules.

#include "CodeSharer/RuleSet.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace CodeSharer {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

RuleSet::RuleSet(std::set<std::string> excluded_dirs,
                 std::set<std::string> excluded_files,
                 const std::set<std::string>& allowed_extensions,
                 size_t max_chars_per_file)
    : m_excluded_dirs(std::move(excluded_dirs)),
      m_excluded_files(std::move(excluded_files)),
      m_max_chars_per_file(max_chars_per_file)
{
    if (m_max_chars_per_file == 0) {
        throw std::invalid_argument("max_chars_per_file must be greater than 0");
    }

    // Entries of excluded_files are matched both as exact names and, lower-cased,
    // as extensions. A name like ".DS_Store" then also excludes "x.ds_store".
    for (const auto& entry : m_excluded_files) {
        if (entry.size() > 1 && entry[0] == '.') {
            m_excluded_extensions.insert(toLower(entry));
        }
    }

    for (const auto& ext : allowed_extensions) {
        m_allowed_extensions.insert(normalizeExtension(ext));
    }
}

bool RuleSet::isDirectoryExcluded(const std::string& name) const {
    return m_excluded_dirs.count(name) > 0;
}

bool RuleSet::isFileIncluded(const std::string& name) const {
    if (m_excluded_files.count(name) > 0) {
        return false;
    }

    std::string extension = extensionOf(name);
    if (!extension.empty() && m_excluded_extensions.count(extension) > 0) {
        return false;
    }

    if (!m_allowed_extensions.empty() && m_allowed_extensions.count(extension) == 0) {
        return false;
    }

    return true;
}

RuleSet RuleSet::withMaxChars(size_t max_chars_per_file) const {
    return RuleSet(m_excluded_dirs, m_excluded_files, m_allowed_extensions, max_chars_per_file);
}

std::string RuleSet::extensionOf(const std::string& name) {
    size_t dot_pos = name.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos == 0 || dot_pos + 1 == name.size()) {
        return "";
    }
    return toLower(name.substr(dot_pos));
}

std::string RuleSet::normalizeExtension(const std::string& extension) {
    if (extension.empty()) {
        return extension;
    }
    std::string normalized = toLower(extension);
    if (normalized[0] != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

} // namespace CodeSharer
