#include "runners/unittest_runner.h"
#include "runtime/runtime_detector.h"
#include <filesystem>
#include <regex>

namespace testbox {
namespace runners {

namespace fs = std::filesystem;

namespace {

std::optional<TestOutcome> unittestStatus(const std::string& word) {
    if (word == "ok" || word == "unexpected success") return TestOutcome::PASSED;
    if (word == "FAIL" || word == "ERROR") return TestOutcome::FAILED;
    if (word.rfind("skipped", 0) == 0 || word == "expected failure") return TestOutcome::SKIPPED;
    return std::nullopt;
}

// "test_add (pkg.test_core.TestCore.test_add)" or the pre-3.11
// "test_add (pkg.test_core.TestCore)".
std::string caseIdentifier(const std::string& head) {
    static const std::regex re(R"(^(\S+) \(([^)]+)\)$)");
    std::smatch m;
    if (!std::regex_match(head, m, re)) return head;
    std::string method = m[1].str();
    std::string path = m[2].str();
    std::string suffix = "." + method;
    if (path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return path;
    }
    return path + suffix;
}

bool isRule(const std::string& line, char c) {
    return line.size() >= 10 && line.find_first_not_of(c) == std::string::npos;
}

}

bool UnittestRunner::canRun(const RunContext& ctx) const {
    if (ctx.env.runtime.name != runtime::RuntimeName::PYTHON) return false;
    for (const auto& rel : runtime::listProjectFiles(ctx.env.sandbox.workDir)) {
        std::string base = fs::path(rel).filename().string();
        if (base.rfind("test", 0) != 0 || fs::path(base).extension() != ".py") continue;
        std::string content = readFile((fs::path(ctx.env.sandbox.workDir) / rel).string());
        if (content.find("import unittest") != std::string::npos ||
            content.find("from unittest") != std::string::npos) {
            return true;
        }
    }
    return false;
}

RawResult UnittestRunner::execute(const RunContext& ctx) const {
    return runInSandbox(ctx, "python -m unittest discover -v");
}

TestResult parseUnittestOutput(const std::string& text) {
    TestResult result;
    std::vector<std::string> lines = splitLines(text);
    std::map<std::string, size_t> byId;
    std::string pendingHead;
    static const std::regex headRe(R"(^\S+ \([^)]+\)$)");
    static const std::regex ranRe(R"(^Ran (\d+) tests? in )");
    int ranCount = -1;

    for (const auto& line : lines) {
        auto sep = line.find(" ... ");
        if (sep != std::string::npos) {
            std::string head = line.substr(0, sep);
            std::string status = line.substr(sep + 5);
            // A docstring line sits between the test name and its status.
            if (!pendingHead.empty() && !std::regex_match(head, headRe)) head = pendingHead;
            pendingHead.clear();
            auto outcome = unittestStatus(status);
            if (!outcome) continue;
            TestCase tc;
            tc.identifier = caseIdentifier(head);
            tc.outcome = *outcome;
            if (*outcome == TestOutcome::SKIPPED && status.size() > 8) tc.failureMessage = status.substr(8);
            byId[tc.identifier] = result.cases.size();
            result.addCase(std::move(tc));
            continue;
        }
        if (std::regex_match(line, headRe)) {
            pendingHead = line;
            continue;
        }
        std::smatch m;
        if (std::regex_search(line, m, ranRe)) {
            if (auto n = parseCount(m[1].str())) ranCount = *n;
        }
    }

    // Failure blocks:
    // ======
    // FAIL: test_x (pkg.mod.Class.test_x)
    // ------
    // Traceback ...
    // A docstring may follow the title; the traceback starts after the dashes.
    TestCase* current = nullptr;
    bool inHeader = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (isRule(line, '=')) {
            current = nullptr;
            inHeader = false;
            if (i + 1 < lines.size()) {
                const std::string& title = lines[i + 1];
                size_t colon = title.find(": ");
                if (colon != std::string::npos &&
                    (title.compare(0, colon, "FAIL") == 0 || title.compare(0, colon, "ERROR") == 0)) {
                    auto it = byId.find(caseIdentifier(title.substr(colon + 2)));
                    if (it != byId.end()) current = &result.cases[it->second];
                    inHeader = true;
                    ++i;
                }
            }
            continue;
        }
        if (isRule(line, '-')) {
            if (inHeader) inHeader = false;
            else current = nullptr;
            continue;
        }
        if (inHeader) continue;
        if (current) {
            current->output.push_back(line);
            if (!line.empty() && line[0] != ' ' && line.rfind("Traceback", 0) != 0) {
                current->failureMessage = line;
            }
        }
    }

    if (result.cases.empty() && ranCount > 0) {
        static const std::regex failedRe(R"((failures|errors|skipped|expected failures)=(\d+))");
        int failed = 0, skipped = 0;
        for (const auto& line : lines) {
            if (line.rfind("FAILED (", 0) != 0 && line.rfind("OK (", 0) != 0) continue;
            for (auto m = std::sregex_iterator(line.begin(), line.end(), failedRe); m != std::sregex_iterator(); ++m) {
                auto parsed = parseCount((*m)[2].str());
                if (!parsed) continue;
                int n = *parsed;
                std::string kind = (*m)[1].str();
                if (kind == "failures" || kind == "errors") failed += n;
                else skipped += n;
            }
        }
        result.setCounts(ranCount - failed - skipped, failed, skipped);
    }
    if (ranCount == 0) result.setCounts(0, 0, 0);
    return result;
}

TestResult UnittestRunner::normalize(const RawResult& raw, const RunContext& ctx) const {
    (void)ctx;
    const int exitCode = raw.exitCode;
    // 5: no tests ran (Python 3.12+).
    if (exitCode != 0 && exitCode != 1 && exitCode != 5) {
        return executionError(name(), "unittest exited with code " + std::to_string(exitCode));
    }
    TestResult result = parseUnittestOutput(raw.stderrText + "\n" + raw.stdoutText);
    bool sawRun = raw.stderrText.find("\nRan ") != std::string::npos ||
                  raw.stderrText.rfind("Ran ", 0) == 0 || raw.stdoutText.find("Ran ") != std::string::npos;
    if (result.summary.total == 0 && !sawRun) {
        TestResult err = executionError(name(), "unittest output contained no test results");
        err.exitCode = exitCode;
        return err;
    }
    finalizeStatus(result, exitCode == 5 ? 0 : exitCode);
    result.exitCode = exitCode;
    return result;
}

}
}
