// =================================================================
// src/CodeSharer/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-style pattern matching.

#include "CodeSharer/IgnorePattern.hpp"
#include "CodeSharer/Logger.hpp"
#include <fstream>

namespace CodeSharer {

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    compile(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }
    if (m_directory_only && !is_directory) {
        return false;
    }
    return std::regex_match(path, m_regex);
}

void IgnorePattern::compile(std::string pattern) {
    // Ignore files written on Windows keep their carriage returns
    if (!pattern.empty() && pattern.back() == '\r') {
        pattern.pop_back();
    }

    size_t last = pattern.find_last_not_of(" \t");
    if (last == std::string::npos || pattern[0] == '#') {
        m_is_empty = true;
        return;
    }
    pattern.erase(last + 1);
    pattern.erase(0, pattern.find_first_not_of(" \t"));

    if (pattern[0] == '!') {
        m_is_negation = true;
        pattern.erase(0, 1);
    }

    if (!pattern.empty() && pattern.back() == '/') {
        m_directory_only = true;
        pattern.pop_back();
    }

    if (!pattern.empty() && pattern[0] == '/') {
        m_is_anchored = true;
        pattern.erase(0, 1);
    } else if (pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
    }

    if (pattern.empty()) {
        m_is_empty = true;
        return;
    }

    std::string body = globToRegex(pattern);
    std::string full = m_is_anchored ? body : "(?:.*/)?" + body;

    try {
        m_regex = std::regex(full, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Invalid pattern '" + m_original_pattern + "': " + e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob) {
    std::string regex;
    bool in_class = false;

    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];

        if (in_class) {
            if (c == ']') {
                in_class = false;
            } else if (c == '\\') {
                regex += '\\';
            }
            regex += c;
            continue;
        }

        switch (c) {
            case '*':
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    bool at_start = (i == 0 || glob[i - 1] == '/');
                    if (at_start && i + 2 < glob.size() && glob[i + 2] == '/') {
                        // "**/" matches zero or more leading directories
                        regex += "(?:.*/)?";
                        i += 2;
                    } else {
                        regex += ".*";
                        i += 1;
                    }
                } else {
                    regex += "[^/]*";
                }
                break;

            case '?':
                regex += "[^/]";
                break;

            case '[':
                in_class = true;
                regex += '[';
                if (i + 1 < glob.size() && glob[i + 1] == '!') {
                    regex += '^';
                    ++i;
                }
                break;

            case '\\':
                if (i + 1 < glob.size()) {
                    ++i;
                    if (std::string(".^$+*?()[]{}|\\/").find(glob[i]) != std::string::npos) {
                        regex += '\\';
                    }
                    regex += glob[i];
                } else {
                    regex += "\\\\";
                }
                break;

            case '.': case '^': case '$': case '+':
            case '(': case ')': case '{': case '}': case '|':
                regex += '\\';
                regex += c;
                break;

            default:
                regex += c;
                break;
        }
    }

    if (in_class) {
        // Unterminated class: treat the bracket literally
        size_t open = regex.rfind('[');
        regex.insert(open, "\\");
    }

    return regex;
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t before = m_patterns.size();
    std::string line;
    while (std::getline(file, line)) {
        addPattern(line);
    }
    return m_patterns.size() - before;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    bool ignored = false;
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            ignored = !pattern.isNegation();
        }
    }
    return ignored;
}

} // namespace CodeSharer
