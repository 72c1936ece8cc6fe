#include "runners/pytest_runner.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>

namespace testbox {
namespace runners {

using json = nlohmann::json;

namespace {

const char* kCoverageFile = "coverage.json";

std::optional<TestOutcome> pytestStatus(const std::string& word) {
    if (word == "PASSED" || word == "XPASS") return TestOutcome::PASSED;
    if (word == "FAILED" || word == "ERROR") return TestOutcome::FAILED;
    if (word == "SKIPPED" || word == "XFAIL") return TestOutcome::SKIPPED;
    return std::nullopt;
}

bool isSectionRule(const std::string& line, char c) {
    return line.size() >= 3 && line.compare(0, 3, std::string(3, c)) == 0;
}

}

bool PytestRunner::canRun(const RunContext& ctx) const {
    return ctx.env.runtime.name == runtime::RuntimeName::PYTHON && toolAvailable(ctx, "pytest");
}

std::string PytestRunner::command(const RunContext& ctx) {
    std::string cmd = "pytest -v --tb=short -p no:cacheprovider";
    if (ctx.options.collectCoverage) {
        cmd += " --cov=. --cov-report=json:" + sandbox::shellQuote(reportPath(ctx, kCoverageFile));
    }
    return cmd;
}

RawResult PytestRunner::execute(const RunContext& ctx) const {
    std::vector<std::string> sidecars;
    if (ctx.options.collectCoverage) sidecars.push_back(reportPath(ctx, kCoverageFile));
    return runInSandbox(ctx, command(ctx), sidecars);
}

TestResult parsePytestOutput(const std::string& text) {
    TestResult result;
    std::vector<std::string> lines = splitLines(text);
    std::map<std::string, size_t> byId;
    bool sawSummary = false;
    int sumPassed = 0, sumFailed = 0, sumSkipped = 0;
    static const std::regex countRe(R"((\d+) (passed|failed|skipped|errors?|xfailed|xpassed))");

    // Per-case lines: "<nodeid> STATUS [ 20%]".
    for (const auto& line : lines) {
        std::istringstream ls(line);
        std::string first, second;
        ls >> first >> second;
        if (first.find("::") != std::string::npos) {
            auto outcome = pytestStatus(second);
            if (!outcome) continue;
            if (byId.count(first)) continue;
            TestCase tc;
            tc.identifier = first;
            tc.outcome = *outcome;
            byId[first] = result.cases.size();
            result.addCase(std::move(tc));
            continue;
        }
        // Short summary: "FAILED <nodeid> - message".
        auto outcome = pytestStatus(first);
        if (outcome && *outcome == TestOutcome::FAILED && second.find("::") != std::string::npos) {
            auto it = byId.find(second);
            auto dash = line.find(" - ");
            if (it != byId.end() && dash != std::string::npos) {
                result.cases[it->second].failureMessage = line.substr(dash + 3);
            }
            continue;
        }
        if (isSectionRule(line, '=') && std::regex_search(line, countRe) &&
            line.find(" in ") != std::string::npos) {
            sawSummary = true;
            for (auto m = std::sregex_iterator(line.begin(), line.end(), countRe); m != std::sregex_iterator(); ++m) {
                auto parsed = parseCount((*m)[1].str());
                if (!parsed) continue;
                int n = *parsed;
                std::string kind = (*m)[2].str();
                if (kind == "passed" || kind == "xpassed") sumPassed += n;
                else if (kind == "failed" || kind == "error" || kind == "errors") sumFailed += n;
                else sumSkipped += n;
            }
        }
    }

    // Failure sections: "____ test_name ____" followed by the short traceback.
    TestCase* current = nullptr;
    for (const auto& line : lines) {
        if (isSectionRule(line, '_') && line.size() > 6) {
            std::string title = line;
            title.erase(0, title.find_first_not_of("_ "));
            title.erase(title.find_last_not_of("_ ") + 1);
            current = nullptr;
            std::string suffix = "::";
            for (char c : title) {
                if (c == '.') suffix += "::";
                else suffix += c;
            }
            for (auto& tc : result.cases) {
                const std::string& id = tc.identifier;
                if (tc.outcome == TestOutcome::FAILED && id.size() >= suffix.size() &&
                    id.compare(id.size() - suffix.size(), suffix.size(), suffix) == 0) {
                    current = &tc;
                    break;
                }
            }
            continue;
        }
        if (isSectionRule(line, '=')) {
            current = nullptr;
            continue;
        }
        if (current) {
            current->output.push_back(line);
            if (!current->failureMessage && line.rfind("E ", 0) == 0) {
                std::string msg = line.substr(1);
                msg.erase(0, msg.find_first_not_of(' '));
                current->failureMessage = msg;
            }
        }
    }

    if (result.cases.empty() && sawSummary) result.setCounts(sumPassed, sumFailed, sumSkipped);
    return result;
}

std::optional<Coverage> parseCoveragePy(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("totals")) return std::nullopt;
    const json& totals = j["totals"];
    Coverage cov;
    if (totals.contains("percent_covered") && totals["percent_covered"].is_number()) {
        cov.lines = totals["percent_covered"].get<double>();
        cov.statements = cov.lines;
    }
    if (totals.contains("num_branches") && totals["num_branches"].is_number() &&
        totals.contains("covered_branches") && totals["covered_branches"].is_number()) {
        double total = totals["num_branches"].get<double>();
        if (total > 0) cov.branches = 100.0 * totals["covered_branches"].get<double>() / total;
    }
    if (j.contains("files") && j["files"].is_object()) {
        for (auto it = j["files"].begin(); it != j["files"].end(); ++it) {
            if (!it.value().is_object() || !it.value().contains("summary")) continue;
            const json& summary = it.value()["summary"];
            if (summary.contains("percent_covered") && summary["percent_covered"].is_number()) {
                cov.files[it.key()] = summary["percent_covered"].get<double>();
            }
        }
    }
    return cov;
}

TestResult PytestRunner::normalize(const RawResult& raw, const RunContext& ctx) const {
    const int exitCode = raw.exitCode;
    // 0 all passed, 1 failures, 5 nothing collected; anything else is a crash.
    if (exitCode == 5) {
        TestResult empty;
        finalizeStatus(empty, 0);
        empty.exitCode = exitCode;
        return empty;
    }
    if (exitCode != 0 && exitCode != 1) {
        return executionError(name(), "pytest exited with code " + std::to_string(exitCode));
    }

    TestResult result = parsePytestOutput(raw.stdoutText);
    if (result.summary.total == 0) {
        TestResult err = executionError(name(), "pytest output contained no test results");
        err.exitCode = exitCode;
        return err;
    }
    finalizeStatus(result, exitCode);

    if (ctx.options.collectCoverage) {
        auto it = raw.sidecars.find(reportPath(ctx, kCoverageFile));
        if (it != raw.sidecars.end()) {
            result.coverage = parseCoveragePy(it->second);
            if (!result.coverage) LOG_WARN("coverage report unreadable framework=pytest env=" + ctx.env.id);
        }
    }
    return result;
}

}
}
