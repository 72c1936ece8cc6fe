#include "runners/test_runner.h"
#include "runners/pytest_runner.h"
#include "runners/unittest_runner.h"
#include "runners/js_runners.h"
#include "runners/bun_runner.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <charconv>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace testbox {
namespace runners {

namespace fs = std::filesystem;
using json = nlohmann::json;

static const size_t kOutputTail = 8192;

bool toolAvailable(const RunContext& ctx, const std::string& tool) {
    return sandbox::findExecutable(tool, ctx.env.sandbox.getEnv("PATH"), ctx.env.sandbox.workDir).has_value();
}

bool fileExists(const std::string& workDir, const std::string& relative) {
    std::error_code ec;
    return fs::is_regular_file(fs::path(workDir) / relative, ec);
}

bool anyFileExists(const std::string& workDir, const std::vector<std::string>& names) {
    for (const auto& n : names) {
        if (fileExists(workDir, n)) return true;
    }
    return false;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string reportPath(const RunContext& ctx, const std::string& fileName) {
    return (fs::path(ctx.env.sandbox.tmpDir) / fileName).string();
}

std::optional<int> parseCount(const std::string& digits) {
    if (digits.empty()) return std::nullopt;
    int value = 0;
    const char* end = digits.data() + digits.size();
    auto res = std::from_chars(digits.data(), end, value);
    if (res.ec != std::errc() || res.ptr != end || value < 0 || value > kMaxParsedCount) return std::nullopt;
    return value;
}

std::optional<double> parseDecimal(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value) || value < 0) {
        return std::nullopt;
    }
    return value;
}

RawResult TestRunner::runInSandbox(const RunContext& ctx, const std::string& command,
                                   const std::vector<std::string>& sidecarPaths) const {
    std::error_code ec;
    for (const auto& p : sidecarPaths) fs::remove(p, ec);

    sandbox::CommandOptions opts;
    opts.timeoutMs = static_cast<uint32_t>(utils::boundedTimeoutSeconds(ctx.options.timeoutSeconds)) * 1000;
    opts.isolateNetwork = ctx.options.isolateNetwork;

    LOG_INFO("running tests framework=" + name() + " env=" + ctx.env.id + " cmd=" + command);
    sandbox::CommandResult r = ctx.manager.runCommand(ctx.env.sandbox, command, opts);

    RawResult raw;
    raw.exitCode = r.exitCode;
    raw.timedOut = r.timedOut;
    raw.durationMs = r.durationMs;
    raw.stdoutText = std::move(r.stdoutText);
    raw.stderrText = std::move(r.stderrText);
    for (const auto& p : sidecarPaths) {
        if (fs::is_regular_file(p, ec)) raw.sidecars[p] = readFile(p);
    }
    return raw;
}

static TestRunnerRegistry buildDefaultRunners() {
    TestRunnerRegistry r;
    r.add(std::make_unique<PytestRunner>());
    r.add(std::make_unique<UnittestRunner>());
    r.add(std::make_unique<JestRunner>());
    r.add(std::make_unique<VitestRunner>());
    r.add(std::make_unique<BunTestRunner>());
    return r;
}

const TestRunnerRegistry& TestRunnerRegistry::defaults() {
    static const TestRunnerRegistry registry = buildDefaultRunners();
    return registry;
}

void TestRunnerRegistry::add(std::unique_ptr<TestRunner> runner) {
    runners_.push_back(std::move(runner));
}

const TestRunner* TestRunnerRegistry::find(const std::string& name) const {
    for (const auto& r : runners_) {
        if (r->name() == name) return r.get();
    }
    return nullptr;
}

std::vector<std::string> TestRunnerRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& r : runners_) out.push_back(r->name());
    return out;
}

std::vector<const TestRunner*> TestRunnerRegistry::detect(const RunContext& ctx) const {
    std::vector<const TestRunner*> out;
    for (const auto& r : runners_) {
        if (r->canRun(ctx)) out.push_back(r.get());
    }
    return out;
}

RunStatus combineStatus(const std::vector<TestResult>& results) {
    if (results.empty()) return RunStatus::EXECUTION_ERROR;
    bool anyTimeout = false, anyError = false, anyFailed = false;
    for (const auto& r : results) {
        if (r.status == RunStatus::TIMEOUT) anyTimeout = true;
        else if (r.status == RunStatus::EXECUTION_ERROR) anyError = true;
        else if (r.status == RunStatus::FAILED) anyFailed = true;
    }
    if (anyTimeout) return RunStatus::TIMEOUT;
    if (anyError) return RunStatus::EXECUTION_ERROR;
    if (anyFailed) return RunStatus::FAILED;
    return RunStatus::PASSED;
}

json toJson(const RunReport& report) {
    json j;
    j["env_id"] = report.envId;
    j["status"] = runStatusName(report.status);
    j["success"] = report.success;
    json results = json::array();
    for (const auto& r : report.results) results.push_back(toJson(r));
    j["results"] = results;
    if (!report.error.empty()) j["error"] = report.error;
    return j;
}

TestExecutor::TestExecutor(const TestRunnerRegistry& registry, const sandbox::SandboxManager& manager,
                           const RunOptions& options)
    : registry_(registry), manager_(manager), options_(options) {
    options_.timeoutSeconds = static_cast<uint32_t>(utils::boundedTimeoutSeconds(options_.timeoutSeconds));
}

std::vector<std::string> TestExecutor::detect(const environment::Environment& env) const {
    RunContext ctx{env, manager_, options_};
    std::vector<std::string> names;
    for (const auto* r : registry_.detect(ctx)) names.push_back(r->name());
    return names;
}

TestResult TestExecutor::executeOne(const TestRunner& runner, const environment::Environment& env) const {
    RunContext ctx{env, manager_, options_};
    RawResult raw;
    try {
        raw = runner.execute(ctx);
    } catch (const Exception& e) {
        LOG_ERROR("test execution failed framework=" + runner.name() + " env=" + env.id +
                  " error=" + e.error().message);
        return executionError(runner.name(), e.error().message);
    }

    TestResult result;
    if (raw.timedOut) {
        LOG_WARN("test run timed out framework=" + runner.name() + " env=" + env.id +
                 " timeout_s=" + std::to_string(options_.timeoutSeconds));
        result = timeoutResult(runner.name(), options_.timeoutSeconds);
        result.exitCode = raw.exitCode;
    } else {
        try {
            result = runner.normalize(raw, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("cannot parse test output framework=" + runner.name() + " env=" + env.id +
                      " error=" + e.what());
            result = executionError(runner.name(), std::string("unreadable test output: ") + e.what());
            result.exitCode = raw.exitCode;
        }
    }
    result.framework = runner.name();
    result.durationMs = raw.durationMs;
    result.stdoutTail = sandbox::tail(raw.stdoutText, kOutputTail);
    result.stderrTail = sandbox::tail(raw.stderrText, kOutputTail);

    LOG_INFO("tests finished framework=" + runner.name() + " env=" + env.id +
             " status=" + runStatusName(result.status) +
             " total=" + std::to_string(result.summary.total) +
             " passed=" + std::to_string(result.summary.passed) +
             " failed=" + std::to_string(result.summary.failed) +
             " skipped=" + std::to_string(result.summary.skipped));
    return result;
}

RunReport TestExecutor::executeAll(const environment::Environment& env) const {
    RunReport report;
    report.envId = env.id;
    RunContext ctx{env, manager_, options_};
    std::vector<const TestRunner*> runners = registry_.detect(ctx);
    if (runners.empty()) {
        report.status = RunStatus::EXECUTION_ERROR;
        report.error = "no test framework detected";
        LOG_WARN("no test framework detected env=" + env.id);
        return report;
    }
    for (const auto* r : runners) report.results.push_back(executeOne(*r, env));
    report.status = combineStatus(report.results);
    report.success = report.status == RunStatus::PASSED;
    return report;
}

}
}
