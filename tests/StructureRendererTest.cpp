// =================================================================
// tests/StructureRendererTest.cpp
// =================================================================
// Unit tests for StructureRenderer component.

#include "CodeSharer/StructureRenderer.hpp"
#include <cassert>
#include <iostream>
#include <string>

namespace {

CodeSharer::FileEntry makeFile(const std::string& parent, const std::string& name) {
    CodeSharer::FileEntry file;
    file.name = name;
    file.relative_path = parent.empty() ? name : parent + "/" + name;
    return file;
}

CodeSharer::DirEntry makeDir(const std::string& parent, const std::string& name) {
    CodeSharer::DirEntry dir;
    dir.name = name;
    dir.relative_path = parent.empty() ? name : parent + "/" + name;
    return dir;
}

// proj/
//   src/
//     core/
//       engine.py
//     util.py
//   empty/
//   README.md
CodeSharer::DirEntry sampleTree() {
    CodeSharer::DirEntry core = makeDir("src", "core");
    core.files.push_back(makeFile("src/core", "engine.py"));

    CodeSharer::DirEntry src = makeDir("", "src");
    src.directories.push_back(core);
    src.files.push_back(makeFile("src", "util.py"));

    CodeSharer::DirEntry root;
    root.name = "proj";
    root.directories.push_back(src);
    root.directories.push_back(makeDir("", "empty"));
    root.files.push_back(makeFile("", "README.md"));
    return root;
}

} // namespace

class StructureRendererTest {
public:
    void testBasicRendering() {
        std::cout << "Testing basic rendering..." << std::endl;

        CodeSharer::StructureRenderer renderer;
        std::string expected =
            "src/\n"
            "    core/\n"
            "        engine.py\n"
            "    util.py\n"
            "empty/\n"
            "README.md\n";
        assert(renderer.render(sampleTree()) == expected);

        std::cout << "✓ Basic rendering test passed" << std::endl;
    }

    void testSelectedMarker() {
        std::cout << "Testing selected file marker..." << std::endl;

        CodeSharer::StructureRenderer renderer;
        std::string output = renderer.render(sampleTree(), "src/util.py");

        assert(output.find("    >>> util.py <<<\n") != std::string::npos);
        assert(output.find(">>> engine.py <<<") == std::string::npos);
        assert(output.find(">>> README.md <<<") == std::string::npos);

        std::cout << "✓ Selected marker test passed" << std::endl;
    }

    void testAccessDenied() {
        std::cout << "Testing access denied entries..." << std::endl;

        CodeSharer::DirEntry root;
        CodeSharer::DirEntry locked = makeDir("", "locked");
        locked.access_denied = true;
        root.directories.push_back(locked);

        CodeSharer::StructureRenderer renderer;
        assert(renderer.render(root) == "locked/\n    [Access denied]\n");

        CodeSharer::DirEntry denied_root;
        denied_root.access_denied = true;
        assert(renderer.render(denied_root) == "[Access denied]\n");

        std::cout << "✓ Access denied test passed" << std::endl;
    }

    void testDepthLimit() {
        std::cout << "Testing depth limit..." << std::endl;

        CodeSharer::RenderOptions options;
        options.max_depth = 1;
        CodeSharer::StructureRenderer renderer(options);

        std::string expected =
            "src/\n"
            "    ...\n"
            "empty/\n"
            "README.md\n";
        assert(renderer.render(sampleTree()) == expected);

        // The branch leading to the selected file stays expanded
        std::string with_selection = renderer.render(sampleTree(), "src/core/engine.py");
        assert(with_selection.find("        >>> engine.py <<<\n") != std::string::npos);

        options.max_depth = 2;
        CodeSharer::StructureRenderer deeper(options);
        std::string two_levels = deeper.render(sampleTree());
        assert(two_levels.find("    core/\n        ...\n") != std::string::npos);
        assert(two_levels.find("    util.py\n") != std::string::npos);

        std::cout << "✓ Depth limit test passed" << std::endl;
    }

    void testCustomIndent() {
        std::cout << "Testing custom indentation..." << std::endl;

        CodeSharer::RenderOptions options;
        options.indent = "  ";
        CodeSharer::StructureRenderer renderer(options);
        std::string output = renderer.render(sampleTree());
        assert(output.find("\n  core/\n    engine.py\n") != std::string::npos);

        std::cout << "✓ Custom indentation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StructureRenderer unit tests..." << std::endl;

        testBasicRendering();
        testSelectedMarker();
        testAccessDenied();
        testDepthLimit();
        testCustomIndent();

        std::cout << "All StructureRenderer tests passed!" << std::endl;
    }
};

int main() {
    try {
        StructureRendererTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
