#include "runners/bun_runner.h"
#include "runners/js_runners.h"
#include <regex>

namespace testbox {
namespace runners {

bool BunTestRunner::canRun(const RunContext& ctx) const {
    const std::string& dir = ctx.env.sandbox.workDir;
    return ctx.env.runtime.name == runtime::RuntimeName::BUN && !jestConfigured(dir) &&
           !vitestConfigured(dir) && toolAvailable(ctx, "bun");
}

RawResult BunTestRunner::execute(const RunContext& ctx) const {
    return runInSandbox(ctx, "bun test");
}

TestResult parseBunTestOutput(const std::string& text) {
    static const std::regex caseRe(R"(^\((pass|fail|skip|todo)\) (.*?)(?: \[([0-9.]+)(ms|s)\])?$)");
    static const std::regex fileRe(R"(^(\S+(?:\.test|\.spec|_test|_spec)\.[cm]?[jt]sx?):$)");
    static const std::regex totalRe(R"(^\s*(\d+) (pass|fail|skip|todo)$)");

    TestResult result;
    std::string currentFile;
    std::vector<std::string> pending;   // bun prints failure details before "(fail)"
    int totPass = 0, totFail = 0, totSkip = 0;
    bool sawTotals = false;

    for (const auto& line : splitLines(text)) {
        std::smatch m;
        if (std::regex_match(line, m, fileRe)) {
            currentFile = m[1].str();
            pending.clear();
            continue;
        }
        if (std::regex_match(line, m, caseRe)) {
            TestCase tc;
            std::string name = m[2].str();
            tc.identifier = currentFile.empty() ? name : currentFile + " > " + name;
            std::string kind = m[1].str();
            tc.outcome = kind == "pass" ? TestOutcome::PASSED
                       : kind == "fail" ? TestOutcome::FAILED : TestOutcome::SKIPPED;
            if (m[3].matched) {
                if (auto d = parseDecimal(m[3].str())) tc.durationMs = m[4].str() == "s" ? *d * 1000.0 : *d;
            }
            if (tc.outcome == TestOutcome::FAILED) {
                tc.output = pending;
                for (const auto& p : pending) {
                    if (p.rfind("error:", 0) == 0) {
                        std::string msg = p.substr(6);
                        msg.erase(0, msg.find_first_not_of(' '));
                        tc.failureMessage = msg;
                        break;
                    }
                }
            }
            pending.clear();
            result.addCase(std::move(tc));
            continue;
        }
        if (std::regex_match(line, m, totalRe)) {
            sawTotals = true;
            auto parsed = parseCount(m[1].str());
            if (!parsed) continue;
            int n = *parsed;
            std::string kind = m[2].str();
            if (kind == "pass") totPass += n;
            else if (kind == "fail") totFail += n;
            else totSkip += n;
            continue;
        }
        if (!line.empty()) pending.push_back(line);
    }

    if (result.cases.empty() && sawTotals) result.setCounts(totPass, totFail, totSkip);
    return result;
}

TestResult BunTestRunner::normalize(const RawResult& raw, const RunContext& ctx) const {
    (void)ctx;
    const int exitCode = raw.exitCode;
    if (exitCode != 0 && exitCode != 1) {
        return executionError(name(), "bun test exited with code " + std::to_string(exitCode));
    }
    // bun writes its reporter output to stderr.
    TestResult result = parseBunTestOutput(raw.stderrText + "\n" + raw.stdoutText);
    if (result.summary.total == 0) {
        TestResult err = executionError(name(), "bun test output contained no test results");
        err.exitCode = exitCode;
        return err;
    }
    finalizeStatus(result, exitCode);
    return result;
}

}
}
