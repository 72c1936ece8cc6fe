#include "runners/js_runners.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace testbox {
namespace runners {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kJestReport = "jest-report.json";
const char* kVitestReport = "vitest-report.json";
const char* kCoverageDir = "coverage";

const std::vector<std::string> kJestConfigs = {
    "jest.config.js", "jest.config.ts", "jest.config.mjs", "jest.config.cjs", "jest.config.json",
};

const std::vector<std::string> kVitestConfigs = {
    "vitest.config.js", "vitest.config.ts", "vitest.config.mjs", "vitest.config.mts", "vitest.config.cjs",
    "vite.config.js", "vite.config.ts", "vite.config.mjs",
};

bool isJsRuntime(const RunContext& ctx) {
    return ctx.env.runtime.name == runtime::RuntimeName::NODE ||
           ctx.env.runtime.name == runtime::RuntimeName::BUN;
}

std::string relativeTo(const std::string& path, const std::string& base) {
    if (base.empty()) return path;
    std::error_code ec;
    fs::path rel = fs::relative(path, base, ec);
    if (ec || rel.empty() || rel.native().rfind("..", 0) == 0) return path;
    return rel.generic_string();
}

// Reports come from project code; a field of the wrong type reads as absent.
std::string stringField(const json& node, const char* key, const std::string& fallback = std::string()) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::string joinTitles(const json& assertion) {
    if (assertion.contains("fullName") && assertion["fullName"].is_string()) {
        return assertion["fullName"].get<std::string>();
    }
    std::string out;
    if (assertion.contains("ancestorTitles") && assertion["ancestorTitles"].is_array()) {
        for (const auto& t : assertion["ancestorTitles"]) {
            if (t.is_string()) out += t.get<std::string>() + " > ";
        }
    }
    return out + stringField(assertion, "title", "<unnamed>");
}

TestResult normalizeReport(const std::string& framework, const RawResult& raw, const std::string& reportFile,
                           const RunContext& ctx) {
    const int exitCode = raw.exitCode;
    if (exitCode != 0 && exitCode != 1) {
        return executionError(framework, framework + " exited with code " + std::to_string(exitCode));
    }
    auto it = raw.sidecars.find(reportFile);
    std::optional<TestResult> parsed;
    if (it != raw.sidecars.end()) parsed = parseJestReport(it->second, ctx.env.sandbox.workDir);
    // Fall back to a report printed on stdout.
    if (!parsed) parsed = parseJestReport(raw.stdoutText, ctx.env.sandbox.workDir);
    if (!parsed) {
        TestResult err = executionError(framework, framework + " produced no readable JSON report");
        err.exitCode = exitCode;
        return err;
    }
    TestResult result = std::move(*parsed);
    result.framework = framework;
    finalizeStatus(result, exitCode);
    return result;
}

}

bool packageJsonMentions(const std::string& workDir, const std::string& name) {
    std::string text = readFile((fs::path(workDir) / "package.json").string());
    if (text.empty()) return false;
    json pkg = json::parse(text, nullptr, false);
    if (pkg.is_discarded() || !pkg.is_object()) return false;
    if (pkg.contains(name)) return true;
    for (const char* section : {"dependencies", "devDependencies", "peerDependencies"}) {
        if (pkg.contains(section) && pkg[section].is_object() && pkg[section].contains(name)) return true;
    }
    if (pkg.contains("scripts") && pkg["scripts"].is_object()) {
        for (const auto& script : pkg["scripts"]) {
            if (script.is_string() && script.get<std::string>().find(name) != std::string::npos) return true;
        }
    }
    return false;
}

bool jestConfigured(const std::string& workDir) {
    return anyFileExists(workDir, kJestConfigs) || packageJsonMentions(workDir, "jest");
}

bool vitestConfigured(const std::string& workDir) {
    return anyFileExists(workDir, kVitestConfigs) || packageJsonMentions(workDir, "vitest");
}

std::optional<TestResult> parseJestReport(const std::string& text, const std::string& workDir) {
    json report = json::parse(text, nullptr, false);
    if (report.is_discarded() || !report.is_object() || !report.contains("testResults") ||
        !report["testResults"].is_array()) {
        return std::nullopt;
    }

    TestResult result;
    for (const auto& file : report["testResults"]) {
        if (!file.is_object()) continue;
        std::string fileName = relativeTo(stringField(file, "name"), workDir);
        const json& assertions = file.contains("assertionResults") && file["assertionResults"].is_array()
                                     ? file["assertionResults"] : json::array();
        for (const auto& a : assertions) {
            if (!a.is_object()) continue;
            TestCase tc;
            std::string title = joinTitles(a);
            tc.identifier = fileName.empty() ? title : fileName + " > " + title;
            auto outcome = parseOutcome(stringField(a, "status"));
            tc.outcome = outcome ? *outcome : TestOutcome::FAILED;
            if (a.contains("duration") && a["duration"].is_number()) tc.durationMs = a["duration"].get<double>();
            if (a.contains("failureMessages") && a["failureMessages"].is_array()) {
                for (const auto& msg : a["failureMessages"]) {
                    if (!msg.is_string()) continue;
                    std::string m = msg.get<std::string>();
                    for (auto& l : splitLines(m)) tc.output.push_back(l);
                    if (!tc.failureMessage) tc.failureMessage = m.substr(0, m.find('\n'));
                }
            }
            result.addCase(std::move(tc));
        }
        // A suite that failed to load has no assertions but a message.
        if (assertions.empty() && stringField(file, "status") == "failed") {
            TestCase tc;
            tc.identifier = fileName.empty() ? "<suite>" : fileName;
            tc.outcome = TestOutcome::FAILED;
            std::string m = stringField(file, "message");
            if (!m.empty()) {
                tc.failureMessage = m.substr(0, m.find('\n'));
                tc.output = splitLines(m);
            }
            result.addCase(std::move(tc));
        }
    }
    return result;
}

std::optional<Coverage> parseIstanbulSummary(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("total") || !j["total"].is_object()) {
        return std::nullopt;
    }
    auto pct = [](const json& node, const char* key) -> std::optional<double> {
        if (!node.contains(key) || !node[key].is_object()) return std::nullopt;
        const json& m = node[key];
        if (m.contains("pct") && m["pct"].is_number()) return m["pct"].get<double>();
        return std::nullopt;
    };
    Coverage cov;
    const json& total = j["total"];
    cov.lines = pct(total, "lines");
    cov.statements = pct(total, "statements");
    cov.branches = pct(total, "branches");
    cov.functions = pct(total, "functions");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "total" || !it.value().is_object()) continue;
        if (auto p = pct(it.value(), "lines")) cov.files[it.key()] = *p;
    }
    return cov;
}

bool JestRunner::canRun(const RunContext& ctx) const {
    return isJsRuntime(ctx) && jestConfigured(ctx.env.sandbox.workDir) && toolAvailable(ctx, "jest");
}

RawResult JestRunner::execute(const RunContext& ctx) const {
    std::string report = reportPath(ctx, kJestReport);
    return runInSandbox(ctx, "jest --ci --json --outputFile=" + sandbox::shellQuote(report), {report});
}

TestResult JestRunner::normalize(const RawResult& raw, const RunContext& ctx) const {
    return normalizeReport(name(), raw, reportPath(ctx, kJestReport), ctx);
}

bool VitestRunner::canRun(const RunContext& ctx) const {
    return isJsRuntime(ctx) && vitestConfigured(ctx.env.sandbox.workDir) && toolAvailable(ctx, "vitest");
}

RawResult VitestRunner::execute(const RunContext& ctx) const {
    std::string report = reportPath(ctx, kVitestReport);
    std::string cmd = "vitest run --reporter=json --outputFile=" + sandbox::shellQuote(report);
    std::vector<std::string> sidecars = {report};
    if (ctx.options.collectCoverage) {
        std::string dir = reportPath(ctx, kCoverageDir);
        cmd += " --coverage --coverage.reporter=json-summary --coverage.reportsDirectory=" + sandbox::shellQuote(dir);
        sidecars.push_back((fs::path(dir) / "coverage-summary.json").string());
    }
    return runInSandbox(ctx, cmd, sidecars);
}

TestResult VitestRunner::normalize(const RawResult& raw, const RunContext& ctx) const {
    TestResult result = normalizeReport(name(), raw, reportPath(ctx, kVitestReport), ctx);
    if (ctx.options.collectCoverage && result.status != RunStatus::EXECUTION_ERROR) {
        std::string summary = (fs::path(reportPath(ctx, kCoverageDir)) / "coverage-summary.json").string();
        auto it = raw.sidecars.find(summary);
        if (it != raw.sidecars.end()) {
            result.coverage = parseIstanbulSummary(it->second);
            if (!result.coverage) LOG_WARN("coverage summary unreadable framework=vitest env=" + ctx.env.id);
        }
    }
    return result;
}

}
}
