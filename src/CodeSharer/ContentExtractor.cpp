// =================================================================
// src/CodeSharer/ContentExtractor.cpp
// =================================================================
// Implementation for reading file content within a character budget.

#include "CodeSharer/ContentExtractor.hpp"
#include "CodeSharer/Errors.hpp"
#include "CodeSharer/Logger.hpp"
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace CodeSharer {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Length of the UTF-8 sequence starting at bytes[pos], or 0 if it is invalid.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t validSequenceLength(const std::string& bytes, size_t pos) {
    auto byte_at = [&bytes](size_t i) { return static_cast<unsigned char>(bytes[i]); };
    auto is_continuation = [&](size_t i) {
        return i < bytes.size() && (byte_at(i) & 0xC0) == 0x80;
    };

    unsigned char lead = byte_at(pos);
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return is_continuation(pos + 1) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (!is_continuation(pos + 1) || !is_continuation(pos + 2)) {
            return 0;
        }
        unsigned char second = byte_at(pos + 1);
        if (lead == 0xE0 && second < 0xA0) return 0;  // overlong
        if (lead == 0xED && second > 0x9F) return 0;  // surrogate
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (!is_continuation(pos + 1) || !is_continuation(pos + 2) || !is_continuation(pos + 3)) {
            return 0;
        }
        unsigned char second = byte_at(pos + 1);
        if (lead == 0xF0 && second < 0x90) return 0;  // overlong
        if (lead == 0xF4 && second > 0x8F) return 0;  // above U+10FFFF
        return 4;
    }
    return 0;
}

} // namespace

ExtractedContent ExtractedContent::unreadable(const FileEntry& entry, const std::string& message) {
    ExtractedContent content;
    content.entry = entry;
    content.error_message = message;
    return content;
}

ExtractedContent ContentExtractor::extract(const FileEntry& entry, size_t max_chars) const {
    errno = 0;
    std::ifstream file(entry.absolute_path, std::ios::binary);
    if (!file.is_open()) {
        std::string reason = errno != 0 ? std::error_code(errno, std::generic_category()).message()
                                        : "cannot open file";
        throw ReadError(entry.relative_path, reason);
    }

    std::ostringstream raw;
    raw << file.rdbuf();
    if (file.bad()) {
        throw ReadError(entry.relative_path, "I/O error while reading");
    }

    ExtractedContent content;
    content.entry = entry;

    std::string text = normalizeLineEndings(decodeUtf8(raw.str(), content.decode_replaced));
    content.total_chars = countChars(text);

    if (content.total_chars > max_chars) {
        content.text = truncateChars(text, max_chars);
        content.truncated = true;
        LOG_DEBUG("ContentExtractor", "Truncated " + entry.relative_path + " from " +
                  std::to_string(content.total_chars) + " to " + std::to_string(max_chars) + " characters");
    } else {
        content.text = std::move(text);
    }

    return content;
}

std::string ContentExtractor::decodeUtf8(const std::string& bytes, bool& replaced) {
    replaced = false;
    std::string text;
    text.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t length = validSequenceLength(bytes, pos);
        if (length == 0) {
            text += REPLACEMENT_CHARACTER;
            replaced = true;
            ++pos;
        } else {
            text.append(bytes, pos, length);
            pos += length;
        }
    }
    return text;
}

std::string ContentExtractor::normalizeLineEndings(const std::string& text) {
    if (text.find('\r') == std::string::npos) {
        return text;
    }

    std::string normalized;
    normalized.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            normalized += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            normalized += text[i];
        }
    }
    return normalized;
}

size_t ContentExtractor::countChars(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string ContentExtractor::truncateChars(const std::string& text, size_t max_chars) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == max_chars) {
                return text.substr(0, i);
            }
            ++seen;
        }
    }
    return text;
}

} // namespace CodeSharer
