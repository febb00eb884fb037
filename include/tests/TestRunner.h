#pragma once

#include <cstdint>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "logging/Logger.h"

namespace Test {

struct TestResult {
    std::string testName;
    bool passed{true};
    std::vector<std::string> failures;
    std::vector<std::string> warnings;

    void addFailure(const std::string &msg) {
        failures.push_back(msg);
        passed = false;
    }

    void addWarning(const std::string &msg) {
        warnings.push_back(msg);
    }

    /**
     * @brief Record msg as a failure unless condition holds.
     * @return condition, so callers can stop early
     */
    bool check(bool condition, const std::string &msg) {
        if (!condition) addFailure(msg);
        return condition;
    }

    template<typename A, typename B>
    bool checkEqual(const A &actual, const B &expected, const std::string &what) {
        if (actual == expected) return true;
        std::ostringstream oss;
        oss << what << ": expected " << expected << ", got " << actual;
        addFailure(oss.str());
        return false;
    }
};

struct TestCase {
    std::string name;
    std::string description;
    std::function<void(TestResult &)> body;
};

class TestRunner {
public:
    explicit TestRunner(std::string title) : title_{std::move(title)} {
    }

    void add(std::string name, std::string description, std::function<void(TestResult &)> body) {
        tests_.push_back(TestCase{std::move(name), std::move(description), std::move(body)});
    }

    size_t size() const { return tests_.size(); }

    std::vector<TestResult> runAllTests() {
        std::vector<TestResult> results;

        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "           " << title_ << "\n";
        std::cout << std::string(70, '=') << "\n\n";

        for (const auto &test : tests_) {
            results.push_back(runTest(test));
        }

        printSummary(results);
        return results;
    }

    /** @param number 1-based test number as shown by --list */
    std::vector<TestResult> runSingle(size_t number) {
        std::vector<TestResult> results;
        results.push_back(runTest(tests_.at(number - 1)));
        printSummary(results);
        return results;
    }

    void listTests() const {
        std::cout << "\n=== " << title_ << " ===\n\n";
        for (size_t i = 0; i < tests_.size(); ++i) {
            std::cout << "Test " << (i + 1) << ": " << tests_[i].name << "\n";
            std::cout << "        " << tests_[i].description << "\n";
        }
        std::cout << "\n";
    }

    TestResult runTest(const TestCase &test) {
        std::cout << std::string(60, '-') << "\n";
        std::cout << "Running: " << test.name << "\n";

        TestResult result;
        result.testName = test.name;
        try {
            test.body(result);
        } catch (const std::exception &e) {
            result.addFailure(std::string("EXCEPTION: ") + e.what());
        }

        printTestResult(result);
        return result;
    }

private:
    std::string title_;
    std::vector<TestCase> tests_;

    void printTestResult(const TestResult &result) {
        if (result.passed) {
            std::cout << "[PASSED] " << result.testName << "\n";
        } else {
            std::cout << "[FAILED] " << result.testName << "\n";
        }

        for (const auto &failure : result.failures) {
            std::cout << "  [FAIL] " << failure << "\n";
        }

        uint32_t warnCount = 0;
        for (const auto &warning : result.warnings) {
            std::cout << "  [INFO] " << warning << "\n";
            if (++warnCount >= 5) {
                std::cout << "  ... (" << (result.warnings.size() - 5) << " more)\n";
                break;
            }
        }
    }

    void printSummary(const std::vector<TestResult> &results) {
        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "                        TEST SUMMARY\n";
        std::cout << std::string(70, '=') << "\n\n";

        uint32_t passed = 0;
        uint32_t failed = 0;

        for (const auto &r : results) {
            std::cout << "  " << std::left << std::setw(50) << r.testName
                      << (r.passed ? "[PASSED]" : "[FAILED]") << "\n";
            if (r.passed) ++passed;
            else ++failed;
        }

        std::cout << "\n" << std::string(50, '-') << "\n";
        std::cout << "  Total: " << results.size() << " tests, "
                  << passed << " passed, " << failed << " failed\n";

        if (failed == 0) {
            std::cout << "\n  ALL TESTS PASSED!\n";
        } else {
            std::cout << "\n  SOME TESTS FAILED - Review output above\n";
        }

        std::cout << std::string(70, '=') << "\n\n";
    }
};

namespace detail {
    inline void printUsage(const char *programName, size_t count) {
        std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
        std::cout << "Options:\n";
        std::cout << "  --all           Run all tests (default)\n";
        std::cout << "  --test <n>      Run specific test (1-" << count << ")\n";
        std::cout << "  --list          List available tests\n";
        std::cout << "  --output <file> Save results to file\n";
        std::cout << "  --verbose       Show DEBUG logs from the code under test\n";
        std::cout << "  --help          Show this help\n";
    }

    inline void saveResultsToFile(const std::vector<TestResult> &results, const std::string &filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open file " << filename << " for writing\n";
            return;
        }

        time_t now = time(nullptr);
        char timeStr[64];
        strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", localtime(&now));
        file << "Generated: " << timeStr << "\n\n";

        for (const auto &r : results) {
            file << "--- " << r.testName << " ---\n";
            file << "Status: " << (r.passed ? "PASSED" : "FAILED") << "\n";
            for (const auto &f : r.failures) {
                file << "  - " << f << "\n";
            }
            file << "\n";
        }
        std::cout << "Results saved to: " << filename << "\n";
    }
}

/**
 * @brief Shared main() of the test executables.
 * @return 0 when every selected test passed
 */
inline int runMain(TestRunner &runner, int argc, char *argv[]) {
    size_t selected = 0;
    std::string outputFile;
    Logger::setLevel(Logger::Level::WARN);

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            detail::printUsage(argv[0], runner.size());
            return 0;
        }
        if (strcmp(argv[i], "--list") == 0) {
            runner.listTests();
            return 0;
        }
        if (strcmp(argv[i], "--all") == 0) {
            selected = 0;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            Logger::setLevel(Logger::Level::DEBUG);
        } else if (strcmp(argv[i], "--test") == 0 && i + 1 < argc) {
            selected = std::strtoul(argv[++i], nullptr, 10);
            if (selected < 1 || selected > runner.size()) {
                std::cerr << "Invalid test number. Use 1-" << runner.size() << "\n";
                return 1;
            }
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outputFile = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            detail::printUsage(argv[0], runner.size());
            return 1;
        }
    }

    const auto results = selected == 0 ? runner.runAllTests() : runner.runSingle(selected);
    if (!outputFile.empty()) {
        detail::saveResultsToFile(results, outputFile);
    }

    for (const auto &r : results) {
        if (!r.passed) return 1;
    }
    return 0;
}

}
