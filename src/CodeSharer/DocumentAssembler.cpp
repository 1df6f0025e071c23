// =================================================================
// src/CodeSharer/DocumentAssembler.cpp
// =================================================================
// Implementation for composing the final markdown context document.

#include "CodeSharer/DocumentAssembler.hpp"
#include <algorithm>
#include <utility>

namespace CodeSharer {

DocumentAssembler::DocumentAssembler(const ProjectConfig& config, RuleSet rules)
    : m_config(config), m_rules(std::move(rules))
{
}

std::string DocumentAssembler::assemble(const DocumentInputs& inputs) const {
    std::ostringstream out;

    writeTitle(inputs, out);
    writeProjectInfo(inputs, out);
    writeStructure(inputs, out);
    writeCode(inputs, out);
    writeStatistics(inputs, out);
    writeWarnings(inputs, out);

    out << "## PROMPT\n" << inputs.prompt << "\n";
    return out.str();
}

std::string DocumentAssembler::fenceFor(const std::string& text) {
    size_t longest = 0;
    size_t run = 0;
    for (char c : text) {
        if (c == '`') {
            longest = std::max(longest, ++run);
        } else {
            run = 0;
        }
    }
    return std::string(std::max<size_t>(3, longest + 1), '`');
}

void DocumentAssembler::writeTitle(const DocumentInputs& inputs, std::ostringstream& out) const {
    if (inputs.mode == Mode::SINGLE_FILE && inputs.selected) {
        out << "# CONTEXT: `" << inputs.selected->name << "` (" << inputs.project_name << ")\n\n";
    } else {
        out << "# CONTEXT: `" << inputs.project_name << "`\n\n";
    }
}

void DocumentAssembler::writeProjectInfo(const DocumentInputs& inputs, std::ostringstream& out) const {
    out << "## PROJECT INFO\n";
    out << "- **Path**: `" << inputs.root_path << "`\n";
    if (inputs.mode == Mode::SINGLE_FILE && inputs.selected) {
        out << "- **Selected file**: `" << inputs.selected->relative_path << "`\n";
    }
    out << "- **Mode**: " << modeName(inputs.mode) << "\n";

    const auto& allowed = m_rules.allowedExtensions();
    out << "- **Included extensions**: " << (allowed.empty() ? "all" : joinSorted(allowed)) << "\n";
    out << "- **Excluded directories**: " << joinSorted(m_rules.excludedDirs()) << "\n";
    out << "- **Excluded files**: " << joinSorted(m_rules.excludedFiles()) << "\n";
    out << "- **Character limit per file**: " << m_rules.maxCharsPerFile() << "\n";
    out << "- **Directories**: " << countDirectories(inputs.tree) << "\n";
    out << "- **Files**: " << countFiles(inputs.tree) << "\n\n";
}

void DocumentAssembler::writeStructure(const DocumentInputs& inputs, std::ostringstream& out) const {
    RenderOptions options;
    options.max_depth = m_config.structure_max_depth;
    StructureRenderer renderer(options);

    std::string selected_path;
    if (inputs.mode == Mode::SINGLE_FILE && inputs.selected) {
        selected_path = inputs.selected->relative_path;
    }

    const std::string structure = renderer.render(inputs.tree, selected_path);
    const std::string fence = fenceFor(structure);
    out << "## STRUCTURE\n" << fence << "\n" << structure << fence << "\n\n";
}

void DocumentAssembler::writeCode(const DocumentInputs& inputs, std::ostringstream& out) const {
    out << "## CODE\n";

    for (const auto& content : inputs.contents) {
        bool is_selected = inputs.mode == Mode::SINGLE_FILE && inputs.selected &&
                           content.entry.relative_path == inputs.selected->relative_path;
        writeBlock(content, is_selected, out);
    }
    out << "\n";
}

void DocumentAssembler::writeBlock(const ExtractedContent& content, bool is_selected,
                                   std::ostringstream& out) const {
    out << "\n### `" << content.entry.relative_path << "`";
    if (is_selected) {
        out << " (selected file)";
    }
    out << "\n";

    if (!content.readable()) {
        const std::string notice = "Error reading file: " + content.error_message;
        const std::string fence = fenceFor(notice);
        out << fence << "\n" << notice << "\n" << fence << "\n";
        return;
    }

    const std::string fence = fenceFor(content.text);
    out << fence << m_config.languageTagFor(content.entry.extension) << "\n";
    out << content.text;
    if (!content.text.empty() && content.text.back() != '\n') {
        out << "\n";
    }
    out << fence << "\n";

    if (content.truncated) {
        out << "> Truncated: showing " << m_rules.maxCharsPerFile() << " of "
            << content.total_chars << " characters.\n";
    }
}

void DocumentAssembler::writeStatistics(const DocumentInputs& inputs, std::ostringstream& out) const {
    size_t included = 0;
    size_t truncated = 0;
    for (const auto& content : inputs.contents) {
        if (content.readable()) {
            ++included;
        }
        if (content.truncated) {
            ++truncated;
        }
    }

    out << "## STATISTICS\n";
    out << "- **Files included**: " << included << "\n";
    out << "- **Files truncated**: " << truncated << "\n";
    if (inputs.mode == Mode::SINGLE_FILE && inputs.selected) {
        out << "- **Mode**: " << modeName(inputs.mode) << " (" << inputs.selected->name << ")\n";
    } else {
        out << "- **Mode**: " << modeName(inputs.mode) << "\n";
    }
    out << "- **Base directory**: " << inputs.root_path << "\n\n";
}

void DocumentAssembler::writeWarnings(const DocumentInputs& inputs, std::ostringstream& out) const {
    if (inputs.issues.empty()) {
        return;
    }

    out << "## WARNINGS\n";
    for (const auto& issue : inputs.issues) {
        out << "- [" << issueKindName(issue.kind) << "] `" << issue.path << "`: " << issue.message << "\n";
    }
    out << "\n";
}

std::string DocumentAssembler::joinSorted(const std::set<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

} // namespace CodeSharer
