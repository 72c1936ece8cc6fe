#pragma once

#include "runners/test_runner.h"

namespace testbox {
namespace runners {

// package.json declares `name` in dependencies, devDependencies, scripts or as
// a top-level key.
bool packageJsonMentions(const std::string& workDir, const std::string& name);

bool jestConfigured(const std::string& workDir);
bool vitestConfigured(const std::string& workDir);

class JestRunner : public TestRunner {
public:
    std::string name() const override { return "jest"; }
    bool canRun(const RunContext& ctx) const override;
    RawResult execute(const RunContext& ctx) const override;
    TestResult normalize(const RawResult& raw, const RunContext& ctx) const override;
};

class VitestRunner : public TestRunner {
public:
    std::string name() const override { return "vitest"; }
    bool canRun(const RunContext& ctx) const override;
    RawResult execute(const RunContext& ctx) const override;
    TestResult normalize(const RawResult& raw, const RunContext& ctx) const override;
};

// Jest-compatible JSON report (jest --json, vitest --reporter=json).
// Returns nullopt when the text is not such a report. File paths are made
// relative to workDir when it is given.
std::optional<TestResult> parseJestReport(const std::string& text, const std::string& workDir = "");

// istanbul json-summary (coverage-summary.json).
std::optional<Coverage> parseIstanbulSummary(const std::string& text);

}
}
