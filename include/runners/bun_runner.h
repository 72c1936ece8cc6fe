#pragma once

#include "runners/test_runner.h"

namespace testbox {
namespace runners {

// `bun test` for Bun projects that configure neither jest nor vitest.
class BunTestRunner : public TestRunner {
public:
    std::string name() const override { return "bun"; }
    bool canRun(const RunContext& ctx) const override;
    RawResult execute(const RunContext& ctx) const override;
    TestResult normalize(const RawResult& raw, const RunContext& ctx) const override;
};

TestResult parseBunTestOutput(const std::string& text);

}
}
