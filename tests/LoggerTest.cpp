// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for Logger file output and rotation.

#include "CodeSharer/Logger.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

class LoggerTest {
private:
    std::string test_dir;

    size_t countOwnLogFiles() {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            if (CodeSharer::Logger::isLogFileName(entry.path().filename().string())) {
                ++count;
            }
        }
        return count;
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    LoggerTest() : test_dir("test_logger") {}

    void testLogFileNames() {
        std::cout << "Testing log file name matching..." << std::endl;

        using CodeSharer::Logger;
        assert(Logger::isLogFileName("codesharer_20260101_120000_001.log"));
        assert(!Logger::isLogFileName("user_important.log"));
        assert(!Logger::isLogFileName("codesharer_notes.txt"));
        assert(!Logger::isLogFileName("codesharer_.log"));
        assert(!Logger::isLogFileName("server.log"));

        std::cout << "✓ Log file name test passed" << std::endl;
    }

    void testRotationKeepsForeignFiles() {
        std::cout << "Testing log rotation..." << std::endl;

        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/user_important.log") << "do not delete";
        std::ofstream(test_dir + "/notes.txt") << "unrelated";

        auto& logger = CodeSharer::Logger::getInstance();
        logger.setConsoleLogging(false);
        // One byte per file forces a rotation on every entry
        logger.enableFileLogging(test_dir, 1, 1);
        logger.info("LoggerTest", "first entry");
        logger.info("LoggerTest", "second entry");
        logger.info("LoggerTest", "third entry");
        logger.flush();

        assert(fs::exists(test_dir + "/user_important.log") && "Rotation leaves other logs alone");
        assert(fs::exists(test_dir + "/notes.txt"));
        assert(countOwnLogFiles() == 1 && "Only the current log file is kept");

        std::cout << "✓ Log rotation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger unit tests..." << std::endl;
        cleanupTestFiles();

        testLogFileNames();
        testRotationKeepsForeignFiles();

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoggerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
