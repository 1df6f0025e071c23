// =================================================================
// src/CodeSharer/FileTree.cpp
// =================================================================

#include "CodeSharer/FileTree.hpp"

namespace CodeSharer {

namespace {

void appendFiles(const DirEntry& dir, std::vector<FileEntry>& out) {
    for (const auto& sub : dir.directories) {
        appendFiles(sub, out);
    }
    out.insert(out.end(), dir.files.begin(), dir.files.end());
}

} // namespace

size_t countDirectories(const DirEntry& dir) {
    size_t count = dir.directories.size();
    for (const auto& sub : dir.directories) {
        count += countDirectories(sub);
    }
    return count;
}

size_t countFiles(const DirEntry& dir) {
    size_t count = dir.files.size();
    for (const auto& sub : dir.directories) {
        count += countFiles(sub);
    }
    return count;
}

std::vector<FileEntry> collectFiles(const DirEntry& dir) {
    std::vector<FileEntry> files;
    appendFiles(dir, files);
    return files;
}

} // namespace CodeSharer
