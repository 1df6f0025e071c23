// =================================================================
// src/CodeSharer/StructureRenderer.cpp
// =================================================================
// Implementation for rendering the project tree.

#include "CodeSharer/StructureRenderer.hpp"
#include <utility>

namespace CodeSharer {

StructureRenderer::StructureRenderer(RenderOptions options)
    : m_options(std::move(options))
{
}

std::string StructureRenderer::render(const DirEntry& tree, const std::string& selected_path) const {
    std::ostringstream out;
    if (tree.access_denied) {
        out << "[Access denied]\n";
        return out.str();
    }
    renderDirectory(tree, 0, selected_path, out);
    return out.str();
}

void StructureRenderer::renderDirectory(const DirEntry& dir, size_t depth,
                                        const std::string& selected_path,
                                        std::ostringstream& out) const {
    const std::string indent = prefix(depth);

    for (const auto& sub : dir.directories) {
        out << indent << sub.name << "/\n";

        if (sub.access_denied) {
            out << prefix(depth + 1) << "[Access denied]\n";
        } else if (!sub.empty()) {
            // The branch holding the selected file is always expanded
            const std::string sub_prefix = sub.relative_path + "/";
            bool holds_selection = selected_path.compare(0, sub_prefix.size(), sub_prefix) == 0;

            if (m_options.max_depth != 0 && depth + 1 >= m_options.max_depth && !holds_selection) {
                out << prefix(depth + 1) << "...\n";
            } else {
                renderDirectory(sub, depth + 1, selected_path, out);
            }
        }
    }

    for (const auto& file : dir.files) {
        if (!selected_path.empty() && file.relative_path == selected_path) {
            out << indent << ">>> " << file.name << " <<<\n";
        } else {
            out << indent << file.name << "\n";
        }
    }
}

std::string StructureRenderer::prefix(size_t depth) const {
    std::string result;
    result.reserve(depth * m_options.indent.size());
    for (size_t i = 0; i < depth; ++i) {
        result += m_options.indent;
    }
    return result;
}

} // namespace CodeSharer
