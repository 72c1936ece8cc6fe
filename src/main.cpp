#include "environment/environment_service.h"
#include "infrastructure/error_handling.h"
#include "runners/test_result.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <getopt.h>

namespace testbox {

using json = nlohmann::json;

static const char* kVersion = "0.1.0";
static std::atomic<bool> g_running{true};

struct CliConfig {
    std::string command;
    std::string target;
    std::string branch;
    std::string configPath;
    std::string logFile;
    int timeoutSeconds = 0;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) g_running = false;
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  serve               JSON-lines requests on stdin, responses on stdout\n";
    std::cout << "  run <path-or-url>   Provision, run tests, print the result, clean up\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -V, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  -v, --verbose       Debug logging\n";
    std::cout << "  -b, --branch NAME   Branch to clone (run)\n";
    std::cout << "  --log-file FILE     Also log to FILE\n";
    std::cout << "  --timeout SECONDS   Test phase timeout\n";
}

void printVersion() {
    std::cout << "testbox " << kVersion << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"branch", required_argument, nullptr, 'b'},
        {"log-file", required_argument, nullptr, 'L'},
        {"timeout", required_argument, nullptr, 'T'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hVc:vb:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'V':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'v':
                config.verbose = true;
                break;
            case 'b':
                config.branch = optarg;
                break;
            case 'L':
                config.logFile = optarg;
                break;
            case 'T': {
                char* end = nullptr;
                long v = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || v <= 0) {
                    std::cerr << "Invalid --timeout\n";
                    return false;
                }
                config.timeoutSeconds = static_cast<int>(v);
                break;
            }
            default:
                return false;
        }
    }

    if (optind < argc) config.command = argv[optind++];
    if (optind < argc) config.target = argv[optind++];
    if (config.command.empty()) {
        std::cerr << "Missing command (serve or run)\n";
        return false;
    }
    if (config.command == "run" && config.target.empty()) {
        std::cerr << "Missing <path-or-url> for run\n";
        return false;
    }
    if (config.command != "run" && config.command != "serve") {
        std::cerr << "Unknown command: " << config.command << "\n";
        return false;
    }
    return true;
}

json badRequest(const std::string& message) {
    return json{{"success", false}, {"error", {{"code", errorCodeName(ErrorCode::INVALID_ARGUMENT)},
                                              {"message", message}}}};
}

std::string stringField(const json& req, const char* key) {
    if (req.contains(key) && req[key].is_string()) return req[key].get<std::string>();
    return "";
}

json handleRequest(environment::EnvironmentService& service, const json& req) {
    std::string op = stringField(req, "op");
    if (op == "create") {
        std::string source = stringField(req, "source");
        if (source.empty()) return badRequest("create needs a source");
        return environment::envelope(service.createFromSource(source, stringField(req, "branch")));
    }
    std::string envId = stringField(req, "env_id");
    if (op == "run_tests" || op == "get" || op == "cleanup") {
        if (envId.empty()) return badRequest(op + " needs an env_id");
    }
    if (op == "run_tests") return environment::envelope(service.runTests(envId));
    if (op == "get") return environment::envelope(service.getEnvironment(envId));
    if (op == "cleanup") return environment::envelope(service.cleanupEnvironment(envId));
    return badRequest("unknown op: " + op);
}

int serve(environment::EnvironmentService& service) {
    LOG_INFO("serving JSON-lines requests on stdin");
    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        json req = json::parse(line, nullptr, false);
        json resp;
        if (req.is_discarded() || !req.is_object()) {
            resp = badRequest("request is not a JSON object");
        } else {
            resp = handleRequest(service, req);
            if (req.contains("id")) resp["id"] = req["id"];
        }
        std::cout << resp.dump() << "\n" << std::flush;
    }
    LOG_INFO("request stream closed");
    return 0;
}

int runOnce(environment::EnvironmentService& service, const CliConfig& config) {
    auto created = service.createFromSource(config.target, config.branch);
    if (created.failed()) {
        std::cout << environment::envelope(created).dump(2) << "\n";
        return 2;
    }
    const std::string id = created.value().id;
    auto report = service.runTests(id);
    std::cout << environment::envelope(report).dump(2) << "\n";

    auto cleaned = service.cleanupEnvironment(id);
    if (cleaned.failed()) LOG_WARN("cleanup failed env=" + id + " error=" + cleaned.error().message);

    if (report.failed()) return 2;
    switch (report.value().status) {
        case runners::RunStatus::PASSED: return 0;
        case runners::RunStatus::FAILED: return 1;
        default: return 2;
    }
}

}

int main(int argc, char* argv[]) {
    testbox::registerSignalHandlers();

    testbox::CliConfig cli;
    if (!testbox::parseArgs(argc, argv, cli)) {
        testbox::printHelp(argv[0]);
        return 2;
    }
    if (cli.showHelp) {
        testbox::printHelp(argv[0]);
        return 0;
    }
    if (cli.showVersion) {
        testbox::printVersion();
        return 0;
    }

    auto& config = testbox::utils::Config::instance();
    config.loadDefaults();
    if (!cli.configPath.empty() && !config.load(cli.configPath)) {
        std::cerr << "Failed to load config: " << cli.configPath << "\n";
        return 2;
    }
    config.applyEnvironmentOverrides();
    if (cli.timeoutSeconds > 0) config.set("tests.timeout_seconds", cli.timeoutSeconds);
    if (!cli.logFile.empty()) config.set("log.file", cli.logFile);

    testbox::utils::LogLevel level = testbox::utils::LogLevel::INFO;
    testbox::utils::Logger::parseLevel(config.getString("log.level", "info"), level);
    if (cli.verbose) level = testbox::utils::LogLevel::DEBUG;
    testbox::utils::Logger::setLevel(level);
    // stdout carries protocol responses and result JSON.
    testbox::utils::Logger::setConsoleToStderr(true);
    std::string logFile = config.getString("log.file");
    if (!logFile.empty()) {
        testbox::utils::Logger::init(logFile);
        testbox::utils::Logger::enableFile(true);
    }

    int rc = 0;
    {
        testbox::environment::EnvironmentService service(
            testbox::environment::ServiceOptions::fromConfig(config));
        rc = cli.command == "serve" ? testbox::serve(service) : testbox::runOnce(service, cli);
    }

    testbox::utils::Logger::shutdown();
    return rc;
}
