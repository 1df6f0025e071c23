// =================================================================
// include/CodeSharer/StructureRenderer.hpp
// =================================================================
// Header for rendering the project tree as indented text.

#pragma once

#include "CodeSharer/FileTree.hpp"
#include <cstddef>
#include <sstream>
#include <string>

namespace CodeSharer {

/**
 * @brief Options controlling the rendered tree
 */
struct RenderOptions {
    size_t max_depth = 0;          ///< Levels rendered below the root, 0 = unlimited
    std::string indent = "    ";   ///< Indentation per level
};

/**
 * @brief Renders a DirEntry tree, one entry per line
 *
 * Example for a selected "src/util.py":
 * @code
 * src/
 *     >>> util.py <<<
 * README.md
 * @endcode
 */
class StructureRenderer {
public:
    explicit StructureRenderer(RenderOptions options = RenderOptions());

    /**
     * @brief Render the children of the root
     * @param tree Tree produced by the TreeWalker
     * @param selected_path Relative path of the file to mark, empty for none
     * @return Rendered lines, each terminated by '\n'
     */
    std::string render(const DirEntry& tree, const std::string& selected_path = "") const;

private:
    RenderOptions m_options;

    void renderDirectory(const DirEntry& dir, size_t depth, const std::string& selected_path,
                         std::ostringstream& out) const;

    std::string prefix(size_t depth) const;
};

} // namespace CodeSharer
