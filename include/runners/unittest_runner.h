#pragma once

#include "runners/test_runner.h"

namespace testbox {
namespace runners {

class UnittestRunner : public TestRunner {
public:
    std::string name() const override { return "unittest"; }
    bool canRun(const RunContext& ctx) const override;
    RawResult execute(const RunContext& ctx) const override;
    TestResult normalize(const RawResult& raw, const RunContext& ctx) const override;
};

// `python -m unittest discover -v` output (it writes to stderr).
TestResult parseUnittestOutput(const std::string& text);

}
}
