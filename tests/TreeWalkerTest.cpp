// =================================================================
// tests/TreeWalkerTest.cpp
// =================================================================
// Unit tests for TreeWalker and IgnorePattern components.

#include "CodeSharer/TreeWalker.hpp"
#include "CodeSharer/IgnorePattern.hpp"
#include "CodeSharer/ProgressListener.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> fileNames(const CodeSharer::DirEntry& dir) {
    std::vector<std::string> names;
    for (const auto& file : dir.files) {
        names.push_back(file.name);
    }
    return names;
}

const CodeSharer::DirEntry* findDir(const CodeSharer::DirEntry& dir, const std::string& name) {
    for (const auto& sub : dir.directories) {
        if (sub.name == name) {
            return &sub;
        }
    }
    return nullptr;
}

bool containsPath(const CodeSharer::DirEntry& dir, const std::string& rel) {
    for (const auto& file : CodeSharer::collectFiles(dir)) {
        if (file.relative_path == rel) {
            return true;
        }
    }
    return false;
}

class CountingListener : public CodeSharer::ProgressListener {
public:
    size_t directories = 0;
    size_t issues = 0;

    void onDirectory(const std::string&) override { ++directories; }
    void onIssue(const CodeSharer::Issue&) override { ++issues; }
};

} // namespace

class TreeWalkerTest {
private:
    std::string test_dir;

    CodeSharer::RuleSet allowAll() {
        return CodeSharer::RuleSet({".git", "build"}, {".gitignore", ".pyc"}, {}, 1000);
    }

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src/core");
        fs::create_directories(test_dir + "/build");
        fs::create_directories(test_dir + "/.git");
        fs::create_directories(test_dir + "/empty");
        fs::create_directories(test_dir + "/docs");

        std::ofstream(test_dir + "/src/main.py") << "print('main')";
        std::ofstream(test_dir + "/src/core/engine.py") << "class Engine: pass";
        std::ofstream(test_dir + "/src/cache.pyc") << "binary";
        std::ofstream(test_dir + "/build/generated.py") << "x = 1";
        std::ofstream(test_dir + "/.git/config") << "[core]";
        std::ofstream(test_dir + "/docs/guide.txt") << "Guide";
        std::ofstream(test_dir + "/README.md") << "# Readme";
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    TreeWalkerTest() : test_dir("test_tree_walker") {}

    void testExcludedDirectories() {
        std::cout << "Testing excluded directories..." << std::endl;

        setupTestFiles();

        CodeSharer::TreeWalker walker(allowAll());
        auto result = walker.walk(test_dir);

        assert(findDir(result.tree, ".git") == nullptr && "Excluded directory should not be listed");
        assert(findDir(result.tree, "build") == nullptr);
        assert(!containsPath(result.tree, "build/generated.py"));
        assert(!containsPath(result.tree, ".git/config"));

        const auto* empty = findDir(result.tree, "empty");
        assert(empty != nullptr && "Empty directories are kept");
        assert(empty->empty());

        assert(containsPath(result.tree, "src/core/engine.py"));
        assert(!containsPath(result.tree, "src/cache.pyc"));
        assert(result.issues.empty());

        cleanupTestFiles();
        std::cout << "✓ Excluded directories test passed" << std::endl;
    }

    void testOrdering() {
        std::cout << "Testing listing order..." << std::endl;

        fs::create_directories(test_dir + "/Zeta");
        fs::create_directories(test_dir + "/alpha");
        std::ofstream(test_dir + "/b.txt") << "b";
        std::ofstream(test_dir + "/a.txt") << "a";
        std::ofstream(test_dir + "/A.txt") << "A";
        std::ofstream(test_dir + "/C.txt") << "C";

        CodeSharer::TreeWalker walker(allowAll());
        auto result = walker.walk(test_dir);

        assert(result.tree.directories.size() == 2);
        assert(result.tree.directories[0].name == "alpha");
        assert(result.tree.directories[1].name == "Zeta");

        auto names = fileNames(result.tree);
        std::vector<std::string> expected = {"A.txt", "a.txt", "b.txt", "C.txt"};
        assert(names == expected && "Case-insensitive order with byte order tie-break");

        cleanupTestFiles();
        std::cout << "✓ Ordering test passed" << std::endl;
    }

    void testExtensionFiltering() {
        std::cout << "Testing extension filtering..." << std::endl;

        setupTestFiles();

        CodeSharer::RuleSet rules({".git", "build"}, {}, {".py"}, 1000);
        CodeSharer::TreeWalker walker(rules);
        auto result = walker.walk(test_dir);

        for (const auto& file : CodeSharer::collectFiles(result.tree)) {
            assert(file.extension == ".py" && "Only allowed extensions are listed");
        }
        assert(result.file_count == 2);

        // The docs directory survives even though all its files were filtered
        const auto* docs = findDir(result.tree, "docs");
        assert(docs != nullptr && docs->empty());

        cleanupTestFiles();
        std::cout << "✓ Extension filtering test passed" << std::endl;
    }

    void testIgnoreFile() {
        std::cout << "Testing ignore file..." << std::endl;

        fs::create_directories(test_dir + "/logs");
        std::ofstream(test_dir + "/.gitignore") << "*.log\nlogs/\n!keep.log\n# comment\n";
        std::ofstream(test_dir + "/app.log") << "noise";
        std::ofstream(test_dir + "/keep.log") << "important";
        std::ofstream(test_dir + "/logs/today.txt") << "noise";
        std::ofstream(test_dir + "/main.cpp") << "int main() {}";

        CodeSharer::TreeWalker walker(allowAll());
        walker.addIgnoreFile(".gitignore");
        walker.addIgnorePattern("main.cpp");
        walker.addIgnorePattern("!main.cpp");
        auto result = walker.walk(test_dir);

        auto names = fileNames(result.tree);
        std::vector<std::string> expected = {"keep.log", "main.cpp"};
        assert(names == expected);
        assert(findDir(result.tree, "logs") == nullptr && "Ignored directory is not listed");

        cleanupTestFiles();
        std::cout << "✓ Ignore file test passed" << std::endl;
    }

    void testSelectedFile() {
        std::cout << "Testing selected file..." << std::endl;

        setupTestFiles();

        // guide.txt fails the extension rule but is selected
        CodeSharer::RuleSet rules({".git", "build"}, {}, {".py"}, 1000);
        CodeSharer::TreeWalker walker(rules);
        auto result = walker.walk(test_dir, test_dir + "/docs/guide.txt");

        assert(result.selected.has_value());
        assert(result.selected->relative_path == "docs/guide.txt");
        assert(result.selected->is_selected);

        const auto* docs = findDir(result.tree, "docs");
        assert(docs != nullptr && docs->files.size() == 1);
        assert(docs->files[0].is_selected);

        // Exactly one entry is marked
        size_t marked = 0;
        for (const auto& file : CodeSharer::collectFiles(result.tree)) {
            if (file.is_selected) ++marked;
        }
        assert(marked == 1);

        cleanupTestFiles();
        std::cout << "✓ Selected file test passed" << std::endl;
    }

    void testSelectedFileInIgnoredDirectory() {
        std::cout << "Testing selected file inside an ignored directory..." << std::endl;

        fs::create_directories(test_dir + "/vendor/lib/deep");
        fs::create_directories(test_dir + "/vendor/sub");
        std::ofstream(test_dir + "/.gitignore") << "vendor/\n";
        std::ofstream(test_dir + "/vendor/secret.py") << "token = 1";
        std::ofstream(test_dir + "/vendor/sub/other.py") << "x = 2";
        std::ofstream(test_dir + "/vendor/lib/extra.py") << "y = 3";
        std::ofstream(test_dir + "/vendor/lib/deep/pick.py") << "z = 4";
        std::ofstream(test_dir + "/main.py") << "print('main')";

        CodeSharer::TreeWalker walker(allowAll());
        walker.addIgnoreFile(".gitignore");
        auto result = walker.walk(test_dir, test_dir + "/vendor/lib/deep/pick.py");

        assert(result.selected.has_value());
        assert(containsPath(result.tree, "vendor/lib/deep/pick.py"));
        assert(containsPath(result.tree, "main.py"));
        assert(!containsPath(result.tree, "vendor/secret.py") && "Ignored siblings stay hidden");
        assert(!containsPath(result.tree, "vendor/sub/other.py"));
        assert(!containsPath(result.tree, "vendor/lib/extra.py"));

        const auto* vendor = findDir(result.tree, "vendor");
        assert(vendor != nullptr);
        assert(vendor->directories.size() == 1 && vendor->directories[0].name == "lib");
        assert(vendor->files.empty());
        assert(findDir(*vendor, "sub") == nullptr);

        cleanupTestFiles();
        std::cout << "✓ Selected file inside an ignored directory test passed" << std::endl;
    }

    void testInvalidTargets() {
        std::cout << "Testing invalid targets..." << std::endl;

        setupTestFiles();
        CodeSharer::TreeWalker walker(allowAll());

        auto expectInvalid = [&walker](const std::string& root, const std::string& selected) {
            bool threw = false;
            try {
                walker.walk(root, selected);
            } catch (const CodeSharer::InvalidRootError&) {
                threw = true;
            }
            return threw;
        };

        assert(expectInvalid(test_dir + "/missing", "") && "Missing root");
        assert(expectInvalid(test_dir + "/README.md", "") && "File as root");
        assert(expectInvalid(test_dir, test_dir + "/build/generated.py") && "Selection in excluded dir");
        assert(expectInvalid(test_dir + "/src", test_dir + "/README.md") && "Selection outside root");
        assert(expectInvalid(test_dir, test_dir + "/src/missing.py") && "Missing selection");

        cleanupTestFiles();
        std::cout << "✓ Invalid targets test passed" << std::endl;
    }

    void testExcludedPath() {
        std::cout << "Testing excluded output path..." << std::endl;

        setupTestFiles();
        std::ofstream(test_dir + "/prompt.md") << "# previous output";

        CodeSharer::TreeWalker walker(allowAll());
        walker.setExcludedPath(fs::absolute(test_dir + "/prompt.md").string());
        auto result = walker.walk(test_dir);

        assert(!containsPath(result.tree, "prompt.md"));
        assert(containsPath(result.tree, "README.md"));

        cleanupTestFiles();
        std::cout << "✓ Excluded path test passed" << std::endl;
    }

    void testSymlinks() {
        std::cout << "Testing symbolic links..." << std::endl;

        setupTestFiles();
        const std::string outside = test_dir + "_outside";
        fs::create_directories(outside);
        std::ofstream(outside + "/secret.txt") << "secret";

        fs::create_directory_symlink(fs::absolute(test_dir + "/src"), test_dir + "/src_link");
        fs::create_symlink(fs::absolute(test_dir + "/README.md"), test_dir + "/readme_link.md");
        fs::create_symlink(fs::absolute(outside + "/secret.txt"), test_dir + "/secret_link.txt");

        CodeSharer::TreeWalker walker(allowAll());
        auto result = walker.walk(test_dir);

        assert(findDir(result.tree, "src_link") == nullptr && "Directory links are not followed");
        assert(containsPath(result.tree, "readme_link.md") && "Links inside the project are kept");
        assert(!containsPath(result.tree, "secret_link.txt") && "Links leaving the project are skipped");

        cleanupTestFiles();
        fs::remove_all(outside);
        std::cout << "✓ Symbolic links test passed" << std::endl;
    }

    void testPermissionDenied() {
        std::cout << "Testing unreadable directory..." << std::endl;

        if (geteuid() == 0) {
            std::cout << "- Skipped: permissions are not enforced for root" << std::endl;
            return;
        }

        setupTestFiles();
        fs::create_directories(test_dir + "/locked");
        std::ofstream(test_dir + "/locked/hidden.py") << "x = 1";
        fs::permissions(test_dir + "/locked", fs::perms::none);

        CountingListener listener;
        CodeSharer::TreeWalker walker(allowAll());
        walker.setProgressListener(&listener);
        auto result = walker.walk(test_dir);

        fs::permissions(test_dir + "/locked", fs::perms::owner_all);

        const auto* locked = findDir(result.tree, "locked");
        assert(locked != nullptr && locked->access_denied);
        assert(result.issues.size() == 1);
        assert(result.issues[0].kind == CodeSharer::IssueKind::PERMISSION_DENIED);
        assert(result.issues[0].path == "locked/");
        assert(listener.issues == 1);
        assert(listener.directories > 0);
        assert(containsPath(result.tree, "src/main.py") && "Walk continues past the failure");

        cleanupTestFiles();
        std::cout << "✓ Unreadable directory test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TreeWalker unit tests..." << std::endl;
        cleanupTestFiles();

        testExcludedDirectories();
        testOrdering();
        testExtensionFiltering();
        testIgnoreFile();
        testSelectedFile();
        testSelectedFileInIgnoredDirectory();
        testInvalidTargets();
        testExcludedPath();
        testSymlinks();
        testPermissionDenied();

        std::cout << "All TreeWalker tests passed!" << std::endl;
    }
};

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing basic pattern matching..." << std::endl;

        CodeSharer::IgnorePattern pattern("*.log");
        assert(pattern.matches("app.log", false));
        assert(pattern.matches("var/app.log", false) && "Unanchored pattern matches at any depth");
        assert(!pattern.matches("app.txt", false));

        CodeSharer::IgnorePattern single("file?.txt");
        assert(single.matches("file1.txt", false));
        assert(!single.matches("file10.txt", false));

        CodeSharer::IgnorePattern cls("[!a]bc");
        assert(cls.matches("xbc", false));
        assert(!cls.matches("abc", false));

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testAnchoredAndDirectoryPatterns() {
        std::cout << "Testing anchored and directory patterns..." << std::endl;

        CodeSharer::IgnorePattern anchored("/build");
        assert(anchored.matches("build", true));
        assert(!anchored.matches("src/build", true));

        CodeSharer::IgnorePattern dir_only("logs/");
        assert(dir_only.isDirectoryOnly());
        assert(dir_only.matches("logs", true));
        assert(!dir_only.matches("logs", false));
        assert(dir_only.matches("var/logs", true));

        CodeSharer::IgnorePattern globstar("doc/**/*.md");
        assert(globstar.matches("doc/a.md", false));
        assert(globstar.matches("doc/x/y/a.md", false));
        assert(!globstar.matches("src/doc/a.md", false));

        std::cout << "✓ Anchored and directory patterns test passed" << std::endl;
    }

    void testNegationAndComments() {
        std::cout << "Testing negation and comments..." << std::endl;

        CodeSharer::IgnorePattern comment("# just a comment");
        assert(comment.isEmpty());
        CodeSharer::IgnorePattern blank("   ");
        assert(blank.isEmpty());

        CodeSharer::IgnorePattern negation("!keep.log");
        assert(negation.isNegation());
        assert(negation.matches("keep.log", false));

        CodeSharer::IgnorePatternSet set;
        set.addPattern("*.log");
        set.addPattern("!keep.log");
        set.addPattern("# ignored line");
        assert(set.size() == 2);
        assert(set.shouldIgnore("debug.log", false));
        assert(!set.shouldIgnore("keep.log", false) && "Last matching pattern wins");
        assert(!set.shouldIgnore("main.cpp", false));

        std::cout << "✓ Negation and comments test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testAnchoredAndDirectoryPatterns();
        testNegationAndComments();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

int main() {
    try {
        TreeWalkerTest walker_tests;
        walker_tests.runAllTests();

        std::cout << std::endl;

        IgnorePatternTest pattern_tests;
        pattern_tests.runAllTests();

        std::cout << "\nAll TreeWalker component tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
