// =================================================================
// include/CodeSharer/ContentExtractor.hpp
// =================================================================
// Header for reading file content within a character budget.

#pragma once

#include "CodeSharer/FileTree.hpp"
#include <cstddef>
#include <string>

namespace CodeSharer {

/**
 * @brief Text of one file, possibly cut to the character budget
 */
struct ExtractedContent {
    FileEntry entry;
    std::string text;               ///< Valid UTF-8, at most the budget in characters
    bool truncated = false;
    size_t total_chars = 0;         ///< Characters before truncation
    bool decode_replaced = false;   ///< Invalid bytes were replaced by U+FFFD
    std::string error_message;      ///< Non-empty when the file could not be read

    bool readable() const { return error_message.empty(); }

    /**
     * @brief Build the placeholder for a file that could not be read
     */
    static ExtractedContent unreadable(const FileEntry& entry, const std::string& message);
};

/**
 * @brief Reads files as UTF-8 text and enforces the per-file character limit
 *
 * Characters are Unicode code points. Decoding never fails: every byte that
 * does not start a valid UTF-8 sequence becomes one U+FFFD. Line endings are
 * normalized to '\n' before counting.
 */
class ContentExtractor {
public:
    /**
     * @brief Extract the text of a file
     * @param entry File to read
     * @param max_chars Character budget, the text is cut to exactly this many
     *        characters when longer
     * @return Extracted content
     * @throws ReadError if the file cannot be opened or read
     */
    ExtractedContent extract(const FileEntry& entry, size_t max_chars) const;

    /**
     * @brief Decode bytes as UTF-8, replacing invalid sequences
     * @param bytes Raw bytes
     * @param replaced Set to true if any replacement happened
     * @return Valid UTF-8 text
     */
    static std::string decodeUtf8(const std::string& bytes, bool& replaced);

    /**
     * @brief Convert "\r\n" and lone "\r" to "\n"
     */
    static std::string normalizeLineEndings(const std::string& text);

    /**
     * @brief Count the code points of valid UTF-8 text
     */
    static size_t countChars(const std::string& text);

    /**
     * @brief Cut valid UTF-8 text to at most max_chars code points
     * @return Prefix ending on a code point boundary
     */
    static std::string truncateChars(const std::string& text, size_t max_chars);
};

} // namespace CodeSharer
