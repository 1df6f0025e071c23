// =================================================================
// include/CodeSharer/FileTree.hpp
// =================================================================
// Nodes of the project tree built by the TreeWalker.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace CodeSharer {

/**
 * @brief A file that survived filtering
 */
struct FileEntry {
    std::string name;           ///< Last path component
    std::string relative_path;  ///< '/' separated, relative to the project root
    std::string absolute_path;
    std::string extension;      ///< Lower-cased with leading dot, may be empty
    bool is_selected = false;
};

/**
 * @brief A directory of the project tree
 *
 * Subdirectories always precede files; both sequences are sorted in the
 * walker's order, so iterating directories then files yields exactly the
 * listing order of the rendered structure.
 */
struct DirEntry {
    std::string name;           ///< Last path component, empty for the root
    std::string relative_path;  ///< Empty for the root
    std::vector<DirEntry> directories;
    std::vector<FileEntry> files;
    bool access_denied = false; ///< Listing failed, children are unknown

    bool empty() const { return directories.empty() && files.empty(); }
};

/**
 * @brief Count the directories below (not including) a node
 */
size_t countDirectories(const DirEntry& dir);

/**
 * @brief Count the files anywhere below a node
 */
size_t countFiles(const DirEntry& dir);

/**
 * @brief Flatten the files of a tree in listing order
 * @param dir Root of the subtree
 * @return Files in depth-first order, directories before files
 */
std::vector<FileEntry> collectFiles(const DirEntry& dir);

} // namespace CodeSharer
