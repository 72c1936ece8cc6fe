#include <gtest/gtest.h>
#include "runners/test_runner.h"
#include "runners/pytest_runner.h"
#include "runners/unittest_runner.h"
#include "runners/js_runners.h"
#include "runners/bun_runner.h"
#include "runtime/runtime_config.h"
#include "test_helpers.h"
#include <filesystem>
#include <stdexcept>

using namespace testbox;
using namespace testbox::runners;
using testbox::testing::writeFile;
using testbox::testing::writeScript;

namespace fs = std::filesystem;

namespace {

// Always applicable; its output can never be read.
class UnreadableRunner : public TestRunner {
public:
    std::string name() const override { return "unreadable"; }
    bool canRun(const RunContext&) const override { return true; }
    RawResult execute(const RunContext&) const override {
        RawResult raw;
        raw.exitCode = 0;
        raw.stdoutText = "garbled";
        return raw;
    }
    TestResult normalize(const RawResult&, const RunContext&) const override {
        throw std::runtime_error("report truncated");
    }
};

const char* kPytestPassing = R"(============================= test session starts ==============================
platform linux -- Python 3.12.1, pytest-8.0.0, pluggy-1.4.0 -- /work/.venv/bin/python
collecting ... collected 5 items

tests/test_math.py::test_add PASSED                                      [ 20%]
tests/test_math.py::test_sub PASSED                                      [ 40%]
tests/test_math.py::TestDiv::test_div PASSED                             [ 60%]
tests/test_math.py::TestDiv::test_zero PASSED                            [ 80%]
tests/test_net.py::test_fetch SKIPPED (needs network)                    [100%]

========================= 4 passed, 1 skipped in 0.05s =========================
)";

const char* kPytestFailing = R"(============================= test session starts ==============================
collected 3 items

tests/test_math.py::test_add PASSED                                      [ 33%]
tests/test_math.py::TestDiv::test_zero FAILED                            [ 66%]
tests/test_math.py::test_slow XFAIL                                      [100%]

=================================== FAILURES ===================================
_____________________________ TestDiv.test_zero ______________________________
tests/test_math.py:14: in test_zero
    assert divide(1, 0) == 0
E   ZeroDivisionError: division by zero
=========================== short test summary info ============================
FAILED tests/test_math.py::TestDiv::test_zero - ZeroDivisionError: division by zero
==================== 1 failed, 1 passed, 1 xfailed in 0.12s ====================
)";

const char* kUnittestOutput = R"(test_add (tests.test_core.TestCore.test_add) ... ok
test_div (tests.test_core.TestCore.test_div)
Division keeps the remainder. ... FAIL
test_net (tests.test_core.TestCore.test_net) ... skipped 'offline'

======================================================================
FAIL: test_div (tests.test_core.TestCore.test_div)
Division keeps the remainder.
----------------------------------------------------------------------
Traceback (most recent call last):
  File "/work/tests/test_core.py", line 9, in test_div
    self.assertEqual(7 // 2, 4)
AssertionError: 3 != 4

----------------------------------------------------------------------
Ran 3 tests in 0.001s

FAILED (failures=1, skipped=1)
)";

const char* kJestReport = R"({
  "numTotalTests": 3,
  "testResults": [
    {
      "name": "/work/src/math.test.js",
      "status": "failed",
      "assertionResults": [
        {"ancestorTitles": ["math"], "title": "adds", "fullName": "math adds", "status": "passed", "duration": 3},
        {"ancestorTitles": ["math"], "title": "divides", "fullName": "math divides", "status": "failed",
         "duration": 5, "failureMessages": ["Error: expect(received).toBe(expected)\n\nExpected: 4\nReceived: 3"]},
        {"ancestorTitles": [], "title": "later", "status": "pending", "failureMessages": []}
      ]
    },
    {
      "name": "/work/src/broken.test.js",
      "status": "failed",
      "message": "Cannot find module './missing'\n  at require",
      "assertionResults": []
    }
  ]
})";

const char* kBunOutput = R"(bun test v1.1.30

src/math.test.ts:
(pass) math > adds [0.12ms]
1 | test("divides", () => {
2 |   expect(7 / 2).toBe(4);
error: expect(received).toBe(expected)
(fail) math > divides [1.05ms]
(skip) math > later

 1 pass
 1 skip
 1 fail
 3 expect() calls
Ran 3 tests across 1 files. [12.00ms]
)";

}

TEST(PytestParserTest, PassedAndSkipped) {
    TestResult r = parsePytestOutput(kPytestPassing);
    EXPECT_EQ(r.summary.total, 5);
    EXPECT_EQ(r.summary.passed, 4);
    EXPECT_EQ(r.summary.skipped, 1);
    EXPECT_EQ(r.summary.failed, 0);
    ASSERT_EQ(r.cases.size(), 5u);
    EXPECT_EQ(r.cases[2].identifier, "tests/test_math.py::TestDiv::test_div");
    EXPECT_EQ(r.cases[4].outcome, TestOutcome::SKIPPED);
    EXPECT_TRUE(r.summary.balanced());
}

TEST(PytestParserTest, FailureDetails) {
    TestResult r = parsePytestOutput(kPytestFailing);
    ASSERT_EQ(r.cases.size(), 3u);
    EXPECT_EQ(r.summary.failed, 1);
    EXPECT_EQ(r.summary.skipped, 1);
    const TestCase& failed = r.cases[1];
    EXPECT_EQ(failed.outcome, TestOutcome::FAILED);
    ASSERT_TRUE(failed.failureMessage.has_value());
    EXPECT_EQ(*failed.failureMessage, "ZeroDivisionError: division by zero");
    EXPECT_FALSE(failed.output.empty());
}

TEST(PytestParserTest, QuietOutputFallsBackToCounts) {
    TestResult r = parsePytestOutput("..F.s\n=== 1 failed, 3 passed, 1 skipped in 0.20s ===\n");
    EXPECT_TRUE(r.cases.empty());
    EXPECT_EQ(r.summary.total, 5);
    EXPECT_EQ(r.summary.failed, 1);
    EXPECT_TRUE(r.summary.balanced());
}

TEST(PytestParserTest, GarbageYieldsNothing) {
    TestResult r = parsePytestOutput("Traceback (most recent call last):\nImportError: no module\n");
    EXPECT_EQ(r.summary.total, 0);
    EXPECT_TRUE(r.summary.balanced());
}

TEST(PytestParserTest, CoverageReport) {
    auto cov = parseCoveragePy(R"({"totals":{"percent_covered":87.5,"num_branches":10,"covered_branches":5},
                                   "files":{"pkg/core.py":{"summary":{"percent_covered":90.0}}}})");
    ASSERT_TRUE(cov.has_value());
    EXPECT_DOUBLE_EQ(*cov->lines, 87.5);
    EXPECT_DOUBLE_EQ(*cov->branches, 50.0);
    EXPECT_DOUBLE_EQ(cov->files.at("pkg/core.py"), 90.0);
    EXPECT_FALSE(parseCoveragePy("not json").has_value());
}

TEST(UnittestParserTest, StatusLinesAndFailureBlocks) {
    TestResult r = parseUnittestOutput(kUnittestOutput);
    ASSERT_EQ(r.cases.size(), 3u);
    EXPECT_EQ(r.summary.passed, 1);
    EXPECT_EQ(r.summary.failed, 1);
    EXPECT_EQ(r.summary.skipped, 1);
    EXPECT_EQ(r.cases[0].identifier, "tests.test_core.TestCore.test_add");
    EXPECT_EQ(r.cases[1].identifier, "tests.test_core.TestCore.test_div");
    ASSERT_TRUE(r.cases[1].failureMessage.has_value());
    EXPECT_EQ(*r.cases[1].failureMessage, "AssertionError: 3 != 4");
}

TEST(UnittestParserTest, LegacyIdentifierGetsMethodName) {
    TestResult r = parseUnittestOutput("test_add (tests.test_core.TestCore) ... ok\n\nRan 1 test in 0.000s\n\nOK\n");
    ASSERT_EQ(r.cases.size(), 1u);
    EXPECT_EQ(r.cases[0].identifier, "tests.test_core.TestCore.test_add");
}

TEST(UnittestParserTest, QuietOutputFallsBackToCounts) {
    TestResult r = parseUnittestOutput(".F.\n----\nRan 3 tests in 0.002s\n\nFAILED (failures=1)\n");
    EXPECT_EQ(r.summary.total, 3);
    EXPECT_EQ(r.summary.failed, 1);
    EXPECT_EQ(r.summary.passed, 2);
}

TEST(JestReportTest, CasesAndBrokenSuites) {
    auto r = parseJestReport(kJestReport, "/work");
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->cases.size(), 4u);
    EXPECT_EQ(r->cases[0].identifier, "src/math.test.js > math adds");
    EXPECT_EQ(r->cases[1].outcome, TestOutcome::FAILED);
    EXPECT_EQ(*r->cases[1].failureMessage, "Error: expect(received).toBe(expected)");
    EXPECT_EQ(r->cases[2].identifier, "src/math.test.js > later");
    EXPECT_EQ(r->cases[2].outcome, TestOutcome::SKIPPED);
    EXPECT_EQ(r->cases[3].identifier, "src/broken.test.js");
    EXPECT_EQ(*r->cases[3].failureMessage, "Cannot find module './missing'");
    EXPECT_EQ(r->summary.failed, 2);
    EXPECT_TRUE(r->summary.balanced());
}

TEST(JestReportTest, RejectsNonReports) {
    EXPECT_FALSE(parseJestReport("PASS src/a.test.js").has_value());
    EXPECT_FALSE(parseJestReport(R"({"success":true})").has_value());
}

TEST(JestReportTest, MistypedFieldsReadAsAbsent) {
    auto r = parseJestReport(
        R"({"testResults":[{"name":null,"assertionResults":[{"title":"a","status":"passed"},
            {"title":7,"status":["x"],"fullName":null}]},
            {"name":3,"status":"failed","message":{"m":1},"assertionResults":[]}]})",
        "/w");
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->cases.size(), 3u);
    EXPECT_EQ(r->cases[0].identifier, "a");
    EXPECT_EQ(r->cases[0].outcome, TestOutcome::PASSED);
    EXPECT_EQ(r->cases[1].identifier, "<unnamed>");
    EXPECT_EQ(r->cases[1].outcome, TestOutcome::FAILED);
    EXPECT_EQ(r->cases[2].identifier, "<suite>");
    EXPECT_FALSE(r->cases[2].failureMessage.has_value());
    EXPECT_TRUE(r->summary.balanced());
}

TEST(JestReportTest, IstanbulSummary) {
    auto cov = parseIstanbulSummary(R"({"total":{"lines":{"pct":81.2},"statements":{"pct":80},
        "branches":{"pct":66.6},"functions":{"pct":100}},
        "/work/src/math.js":{"lines":{"pct":75}}})");
    ASSERT_TRUE(cov.has_value());
    EXPECT_DOUBLE_EQ(*cov->lines, 81.2);
    EXPECT_DOUBLE_EQ(*cov->functions, 100.0);
    EXPECT_DOUBLE_EQ(cov->files.at("/work/src/math.js"), 75.0);
}

TEST(BunParserTest, CasesWithFailureContext) {
    TestResult r = parseBunTestOutput(kBunOutput);
    ASSERT_EQ(r.cases.size(), 3u);
    EXPECT_EQ(r.cases[0].identifier, "src/math.test.ts > math > adds");
    EXPECT_DOUBLE_EQ(*r.cases[0].durationMs, 0.12);
    EXPECT_EQ(r.cases[1].outcome, TestOutcome::FAILED);
    EXPECT_EQ(*r.cases[1].failureMessage, "expect(received).toBe(expected)");
    EXPECT_EQ(r.cases[1].output.size(), 3u);
    EXPECT_EQ(r.cases[2].outcome, TestOutcome::SKIPPED);
    EXPECT_TRUE(r.summary.balanced());
}

TEST(BunParserTest, OversizedNumbersAreIgnored) {
    TestResult r = parseBunTestOutput("src/a.test.ts:\n(pass) adds [1.2.3ms]\n 99999999999 pass\n 1 fail\n");
    ASSERT_EQ(r.cases.size(), 1u);
    EXPECT_EQ(r.cases[0].identifier, "src/a.test.ts > adds");
    EXPECT_FALSE(r.cases[0].durationMs.has_value());

    TestResult totals = parseBunTestOutput(" 99999999999 pass\n 2 fail\n");
    EXPECT_EQ(totals.summary.passed, 0);
    EXPECT_EQ(totals.summary.failed, 2);
    EXPECT_TRUE(totals.summary.balanced());
}

TEST(UnittestParserTest, OversizedCountsAreIgnored) {
    TestResult r = parseUnittestOutput("Ran 99999999999 tests in 0.001s\n\nOK\n");
    EXPECT_EQ(r.summary.total, 0);
    EXPECT_TRUE(r.summary.balanced());
}

TEST(ParseNumberTest, CountsAreBounded) {
    EXPECT_EQ(parseCount("42"), 42);
    EXPECT_EQ(parseCount("0"), 0);
    EXPECT_FALSE(parseCount("").has_value());
    EXPECT_FALSE(parseCount("-1").has_value());
    EXPECT_FALSE(parseCount("12a").has_value());
    EXPECT_FALSE(parseCount("99999999999").has_value());
    EXPECT_FALSE(parseCount(std::to_string(kMaxParsedCount + 1)).has_value());
}

TEST(ParseNumberTest, DecimalsMustBeFinite) {
    EXPECT_DOUBLE_EQ(*parseDecimal("0.12"), 0.12);
    EXPECT_FALSE(parseDecimal("1e999").has_value());
    EXPECT_FALSE(parseDecimal("nan").has_value());
    EXPECT_FALSE(parseDecimal("1.5x").has_value());
    EXPECT_FALSE(parseDecimal("").has_value());
}

TEST(TestResultTest, StatusFromCountsAndExitCode) {
    TestResult r;
    r.setCounts(3, 0, 1);
    finalizeStatus(r, 0);
    EXPECT_EQ(r.status, RunStatus::PASSED);
    EXPECT_TRUE(r.success);

    TestResult failed;
    failed.setCounts(3, 1, 0);
    finalizeStatus(failed, 1);
    EXPECT_EQ(failed.status, RunStatus::FAILED);
    EXPECT_FALSE(failed.success);

    TestResult inconsistent;
    inconsistent.setCounts(3, 0, 0);
    finalizeStatus(inconsistent, 1);
    EXPECT_EQ(inconsistent.status, RunStatus::EXECUTION_ERROR);
    EXPECT_FALSE(inconsistent.error.empty());
}

TEST(TestResultTest, CombinedStatusPrecedence) {
    TestResult passed, failed, error, timeout;
    passed.status = RunStatus::PASSED;
    failed.status = RunStatus::FAILED;
    error.status = RunStatus::EXECUTION_ERROR;
    timeout.status = RunStatus::TIMEOUT;
    EXPECT_EQ(combineStatus({passed}), RunStatus::PASSED);
    EXPECT_EQ(combineStatus({passed, failed}), RunStatus::FAILED);
    EXPECT_EQ(combineStatus({failed, error}), RunStatus::EXECUTION_ERROR);
    EXPECT_EQ(combineStatus({error, timeout, passed}), RunStatus::TIMEOUT);
    EXPECT_EQ(combineStatus({}), RunStatus::EXECUTION_ERROR);
}

TEST(TestResultTest, JsonShape) {
    TestResult r = parsePytestOutput(kPytestFailing);
    r.framework = "pytest";
    finalizeStatus(r, 1);
    nlohmann::json j = toJson(r);
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["summary"]["total"], 3);
    EXPECT_EQ(j["tests"][1]["nodeid"], "tests/test_math.py::TestDiv::test_zero");
    EXPECT_EQ(j["tests"][1]["outcome"], "failed");
    EXPECT_EQ(j["tests"][1]["message"], "ZeroDivisionError: division by zero");
    EXPECT_FALSE(j["tests"][0].contains("message"));
}

TEST(TestRunnerRegistryTest, DefaultsAreOneOwnedInstance) {
    const TestRunnerRegistry& registry = TestRunnerRegistry::defaults();
    EXPECT_EQ(&registry, &TestRunnerRegistry::defaults());
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"pytest", "unittest", "jest", "vitest", "bun"}));

    TestRunnerRegistry local;
    local.add(std::make_unique<UnreadableRunner>());
    TestRunnerRegistry moved = std::move(local);
    ASSERT_NE(moved.find("unreadable"), nullptr);
    EXPECT_EQ(moved.find("pytest"), nullptr);
}

class TestExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = testbox::testing::makeTempDir("executor");
        utils::SandboxConfig cfg;
        cfg.baseDir = testDir.string();
        cfg.namespaces = false;
        cfg.seccomp = false;
        manager = std::make_unique<sandbox::SandboxManager>(cfg);
        env = std::make_shared<environment::Environment>();
        env->id = "env-test";
        env->runtime = runtime::runtimeConfig(runtime::RuntimeName::PYTHON);
        env->sandbox = manager->create();
        // Only fakes are visible, whatever the host has installed.
        env->sandbox.setEnv("PATH", env->sandbox.binDir);
        options.timeoutSeconds = 10;
        options.isolateNetwork = false;
    }

    void TearDown() override {
        manager->destroy(env->sandbox);
        std::filesystem::remove_all(testDir);
    }

    void fakePytest(const std::string& body) {
        writeScript(fs::path(env->sandbox.binDir) / "pytest", body);
    }

    fs::path testDir;
    std::unique_ptr<sandbox::SandboxManager> manager;
    environment::EnvironmentPtr env;
    RunOptions options;
};

TEST_F(TestExecutorTest, PytestRunIsNormalized) {
    writeFile(fs::path(testDir) / "pytest.out", kPytestPassing);
    fakePytest("/bin/cat " + sandbox::shellQuote((testDir / "pytest.out").string()) + "; exit 0");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    EXPECT_EQ(executor.detect(*env), std::vector<std::string>{"pytest"});
    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::PASSED);
    EXPECT_TRUE(report.success);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].framework, "pytest");
    EXPECT_EQ(report.results[0].summary.total, 5);
    EXPECT_EQ(report.results[0].cases.size(), 5u);
}

TEST_F(TestExecutorTest, HungRunTimesOut) {
    fakePytest("/bin/sleep 30");
    options.timeoutSeconds = 1;
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::TIMEOUT);
    EXPECT_FALSE(report.success);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].status, RunStatus::TIMEOUT);
    EXPECT_LT(report.results[0].durationMs, 10000u);
}

TEST_F(TestExecutorTest, CrashIsExecutionError) {
    fakePytest("echo 'INTERNALERROR> boom' 1>&2; exit 3");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::EXECUTION_ERROR);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_NE(report.results[0].stderrTail.find("INTERNALERROR"), std::string::npos);
}

TEST_F(TestExecutorTest, NothingCollectedPasses) {
    fakePytest("echo 'collected 0 items'; exit 5");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::PASSED);
    EXPECT_EQ(report.results[0].summary.total, 0);
    EXPECT_EQ(report.results[0].exitCode, 5);
}

TEST_F(TestExecutorTest, NoFrameworkDetected) {
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);
    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::EXECUTION_ERROR);
    EXPECT_TRUE(report.results.empty());
    EXPECT_FALSE(report.error.empty());
    EXPECT_EQ(toJson(report)["status"], "execution_error");
}

TEST_F(TestExecutorTest, UnittestDetectedFromImports) {
    writeFile(fs::path(env->sandbox.workDir) / "tests" / "test_core.py", "import unittest\n");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);
    EXPECT_EQ(executor.detect(*env), std::vector<std::string>{"unittest"});
}

TEST_F(TestExecutorTest, BunRunnerYieldsToConfiguredJest) {
    env->runtime = runtime::runtimeConfig(runtime::RuntimeName::BUN);
    writeScript(fs::path(env->sandbox.binDir) / "bun", "exit 0");
    writeScript(fs::path(env->sandbox.binDir) / "jest", "exit 0");
    writeFile(fs::path(env->sandbox.workDir) / "package.json", R"({"devDependencies":{"jest":"^29"}})");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);
    EXPECT_EQ(executor.detect(*env), std::vector<std::string>{"jest"});

    writeFile(fs::path(env->sandbox.workDir) / "package.json", R"({"name":"demo"})");
    EXPECT_EQ(executor.detect(*env), std::vector<std::string>{"bun"});
}

TEST_F(TestExecutorTest, OversizedSummaryCountIsExecutionError) {
    fakePytest("echo '=== 99999999999 passed in 0.01s ==='; exit 0");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    EXPECT_EQ(report.status, RunStatus::EXECUTION_ERROR);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].status, RunStatus::EXECUTION_ERROR);
    EXPECT_EQ(report.results[0].summary.total, 0);
}

TEST_F(TestExecutorTest, JestReportWithNullNameIsNormalized) {
    env->runtime = runtime::runtimeConfig(runtime::RuntimeName::NODE);
    writeFile(fs::path(env->sandbox.workDir) / "package.json", R"({"devDependencies":{"jest":"^29"}})");
    writeFile(testDir / "jest.json",
              R"({"testResults":[{"name":null,"assertionResults":[{"title":"a","status":"passed"}]}]})");
    writeScript(fs::path(env->sandbox.binDir) / "jest",
                "for a in \"$@\"; do case \"$a\" in --outputFile=*) out=\"${a#--outputFile=}\";; esac; done\n"
                "/bin/cat " + sandbox::shellQuote((testDir / "jest.json").string()) + " > \"$out\"; exit 0");
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].framework, "jest");
    EXPECT_EQ(report.results[0].status, RunStatus::PASSED);
    ASSERT_EQ(report.results[0].cases.size(), 1u);
    EXPECT_EQ(report.results[0].cases[0].identifier, "a");
}

TEST_F(TestExecutorTest, ThrowingNormalizeKeepsOtherResults) {
    writeFile(fs::path(testDir) / "pytest.out", kPytestPassing);
    fakePytest("/bin/cat " + sandbox::shellQuote((testDir / "pytest.out").string()) + "; exit 0");
    TestRunnerRegistry registry;
    registry.add(std::make_unique<UnreadableRunner>());
    registry.add(std::make_unique<PytestRunner>());
    TestExecutor executor(registry, *manager, options);

    RunReport report = executor.executeAll(*env);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].framework, "unreadable");
    EXPECT_EQ(report.results[0].status, RunStatus::EXECUTION_ERROR);
    EXPECT_NE(report.results[0].error.find("report truncated"), std::string::npos);
    EXPECT_EQ(report.results[0].exitCode, 0);
    EXPECT_EQ(report.results[1].framework, "pytest");
    EXPECT_EQ(report.results[1].status, RunStatus::PASSED);
    EXPECT_EQ(report.status, RunStatus::EXECUTION_ERROR);
}

TEST_F(TestExecutorTest, ZeroTimeoutStillBoundsTheRun) {
    fakePytest("/bin/sleep 30");
    options.timeoutSeconds = 0;
    TestExecutor executor(TestRunnerRegistry::defaults(), *manager, options);

    RunReport report = executor.executeAll(*env);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].status, RunStatus::TIMEOUT);
    EXPECT_LT(report.results[0].durationMs, 10000u);
}
