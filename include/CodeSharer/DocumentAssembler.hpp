// =================================================================
// include/CodeSharer/DocumentAssembler.hpp
// =================================================================
// Header for composing the final markdown context document.

#pragma once

#include "CodeSharer/ContentExtractor.hpp"
#include "CodeSharer/Errors.hpp"
#include "CodeSharer/FileTree.hpp"
#include "CodeSharer/ProjectConfig.hpp"
#include "CodeSharer/RuleSet.hpp"
#include "CodeSharer/StructureRenderer.hpp"
#include "CodeSharer/TargetSpec.hpp"
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace CodeSharer {

/**
 * @brief Everything one document is built from
 */
struct DocumentInputs {
    std::string project_name;
    std::string root_path;                  ///< Absolute project root
    Mode mode = Mode::PROJECT;
    DirEntry tree;
    std::optional<FileEntry> selected;
    std::vector<ExtractedContent> contents; ///< One code block each, in this order
    std::vector<Issue> issues;
    std::string prompt;
};

/**
 * @brief Builds the markdown document handed to the language model
 *
 * Sections, in order: title, PROJECT INFO, STRUCTURE, CODE, STATISTICS,
 * WARNINGS (only when issues exist) and PROMPT. The output depends only on
 * the inputs, so identical runs give byte-identical documents.
 */
class DocumentAssembler {
public:
    /**
     * @brief Construct an assembler
     * @param config Supplies language tags and the structure depth
     * @param rules Rules in effect for the run, described in PROJECT INFO
     */
    DocumentAssembler(const ProjectConfig& config, RuleSet rules);

    /**
     * @brief Compose the document
     * @param inputs Walk and extraction results
     * @return Complete markdown text
     */
    std::string assemble(const DocumentInputs& inputs) const;

    /**
     * @brief Backtick fence that cannot be closed by the text itself
     * @param text Content to be fenced
     * @return At least three backticks, one more than the longest run in text
     */
    static std::string fenceFor(const std::string& text);

private:
    ProjectConfig m_config;
    RuleSet m_rules;

    void writeTitle(const DocumentInputs& inputs, std::ostringstream& out) const;
    void writeProjectInfo(const DocumentInputs& inputs, std::ostringstream& out) const;
    void writeStructure(const DocumentInputs& inputs, std::ostringstream& out) const;
    void writeCode(const DocumentInputs& inputs, std::ostringstream& out) const;
    void writeStatistics(const DocumentInputs& inputs, std::ostringstream& out) const;
    void writeWarnings(const DocumentInputs& inputs, std::ostringstream& out) const;

    void writeBlock(const ExtractedContent& content, bool is_selected, std::ostringstream& out) const;

    static std::string joinSorted(const std::set<std::string>& values);
};

} // namespace CodeSharer
