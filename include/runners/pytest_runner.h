#pragma once

#include "runners/test_runner.h"

namespace testbox {
namespace runners {

class PytestRunner : public TestRunner {
public:
    std::string name() const override { return "pytest"; }
    bool canRun(const RunContext& ctx) const override;
    RawResult execute(const RunContext& ctx) const override;
    TestResult normalize(const RawResult& raw, const RunContext& ctx) const override;

    static std::string command(const RunContext& ctx);
};

// `pytest -v` console output. Exposed for tests.
TestResult parsePytestOutput(const std::string& text);

// coverage.py JSON report (`--cov-report=json`).
std::optional<Coverage> parseCoveragePy(const std::string& text);

}
}
