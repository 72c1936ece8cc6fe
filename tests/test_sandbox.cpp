#include <gtest/gtest.h>
#include "sandbox/sandbox.h"
#include "infrastructure/error_handling.h"
#include "test_helpers.h"
#include <filesystem>
#include <set>
#include <sys/stat.h>

using namespace testbox;
using namespace testbox::sandbox;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        baseDir = testbox::testing::makeTempDir("sandbox");
        utils::SandboxConfig cfg;
        cfg.baseDir = baseDir.string();
        cfg.namespaces = false;
        cfg.seccomp = false;
        manager = std::make_unique<SandboxManager>(cfg);
    }

    void TearDown() override {
        std::filesystem::remove_all(baseDir);
    }

    size_t entriesInBase() const {
        size_t n = 0;
        for (auto it = std::filesystem::directory_iterator(baseDir);
             it != std::filesystem::directory_iterator(); ++it) {
            ++n;
        }
        return n;
    }

    std::filesystem::path baseDir;
    std::unique_ptr<SandboxManager> manager;
};

TEST_F(SandboxTest, CreateLaysOutDirectories) {
    Sandbox sb = manager->create();
    EXPECT_TRUE(std::filesystem::is_directory(sb.workDir));
    EXPECT_TRUE(std::filesystem::is_directory(sb.binDir));
    EXPECT_TRUE(std::filesystem::is_directory(sb.tmpDir));
    EXPECT_TRUE(std::filesystem::is_directory(sb.cacheDir));
    EXPECT_EQ(std::filesystem::path(sb.root).parent_path(), baseDir);
    for (const auto& dir : {sb.workDir, sb.binDir, sb.tmpDir, sb.cacheDir}) {
        EXPECT_EQ(dir.rfind(sb.root, 0), 0u) << dir;
    }
    EXPECT_TRUE(manager->destroy(sb));
}

TEST_F(SandboxTest, EnvironmentPointsInsideSandbox) {
    Sandbox sb = manager->create();
    EXPECT_EQ(sb.getEnv("HOME"), sb.workDir);
    EXPECT_EQ(sb.getEnv("TMPDIR"), sb.tmpDir);
    EXPECT_EQ(sb.getEnv("PATH").rfind(sb.binDir + ":", 0), 0u);
    EXPECT_FALSE(sb.hasEnv("LD_PRELOAD"));

    std::set<std::string> keys;
    for (const auto& kv : sb.env) {
        EXPECT_TRUE(keys.insert(kv.first).second) << "duplicate " << kv.first;
    }
    manager->destroy(sb);
}

TEST_F(SandboxTest, LoaderHooksAreRefused) {
    Sandbox sb = manager->create();
    EXPECT_FALSE(sb.setEnv("LD_PRELOAD", "/tmp/evil.so"));
    EXPECT_FALSE(sb.setEnv("NODE_OPTIONS", "--require x"));
    EXPECT_FALSE(sb.hasEnv("LD_PRELOAD"));
    EXPECT_TRUE(sb.setEnv("FOO", "bar"));
    EXPECT_EQ(sb.getEnv("FOO"), "bar");

    sb.prependPath("/opt/tool/bin");
    EXPECT_EQ(sb.getEnv("PATH").rfind("/opt/tool/bin:", 0), 0u);
    manager->destroy(sb);
}

TEST_F(SandboxTest, DestroyLeavesNothingBehind) {
    Sandbox sb = manager->create();
    testbox::testing::writeFile(std::filesystem::path(sb.workDir) / "deep/nested/file.txt", "x");
    chmod((std::filesystem::path(sb.workDir) / "deep").c_str(), 0500);

    EXPECT_TRUE(manager->destroy(sb));
    EXPECT_FALSE(std::filesystem::exists(sb.root));
    EXPECT_EQ(entriesInBase(), 0u);
    EXPECT_TRUE(manager->destroy(sb));
}

TEST_F(SandboxTest, CreateFailureLeavesNoResidue) {
    utils::SandboxConfig cfg;
    cfg.baseDir = (baseDir / "missing" / "deeper").string();
    testbox::testing::writeFile(baseDir / "missing", "a file, not a directory");
    SandboxManager broken(cfg);
    try {
        broken.create();
        FAIL() << "expected SANDBOX_CREATION";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::SANDBOX_CREATION);
    }
    EXPECT_EQ(entriesInBase(), 1u);
}

TEST_F(SandboxTest, RestrictionReportCoversEveryLayer) {
    Sandbox sb = manager->create();
    RestrictionReport report = manager->applyRestrictions(sb);
    ASSERT_EQ(report.layers.size(), 4u);
    EXPECT_TRUE(report.isApplied(RestrictionLayer::PERMISSIONS));
    EXPECT_TRUE(report.isApplied(RestrictionLayer::RESOURCE_LIMITS));
    EXPECT_FALSE(report.isApplied(RestrictionLayer::NAMESPACES));
    EXPECT_FALSE(report.isApplied(RestrictionLayer::SECCOMP));
    EXPECT_EQ(report.degraded().size(), 2u);
    EXPECT_EQ(sb.restrictions.layers.size(), 4u);

    struct stat st;
    ASSERT_EQ(stat(sb.root.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
    manager->destroy(sb);
}

TEST_F(SandboxTest, RunCommandUsesSandboxEnvironment) {
    Sandbox sb = manager->create();
    setenv("TESTBOX_HOST_SECRET", "s3cret", 1);
    CommandResult r = manager->runCommand(sb, "printf '%s|%s|' \"$HOME\" \"$TESTBOX_HOST_SECRET\"; pwd -P");
    unsetenv("TESTBOX_HOST_SECRET");
    EXPECT_EQ(r.exitCode, 0);
    std::string work = std::filesystem::canonical(sb.workDir).string();
    EXPECT_EQ(r.stdoutText, sb.workDir + "||" + work + "\n");
    manager->destroy(sb);
}

TEST_F(SandboxTest, ExtraEnvOverridesAndHooksAreDropped) {
    Sandbox sb = manager->create();
    CommandOptions opts;
    opts.extraEnv = {{"HOME", "/elsewhere"}, {"LD_PRELOAD", "/tmp/evil.so"}};
    CommandResult r = manager->runCommand(sb, "printf '%s|%s' \"$HOME\" \"$LD_PRELOAD\"", opts);
    EXPECT_EQ(r.stdoutText, "/elsewhere|");
    manager->destroy(sb);
}

TEST_F(SandboxTest, MissingProgramIsReportedBeforeSpawn) {
    Sandbox sb = manager->create();
    try {
        manager->runCommand(sb, "definitely-not-a-real-tool --version");
        FAIL() << "expected COMMAND_NOT_FOUND";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::COMMAND_NOT_FOUND);
    }
    manager->destroy(sb);
}

TEST_F(SandboxTest, ToolsInBinDirAreFound) {
    Sandbox sb = manager->create();
    testbox::testing::writeScript(std::filesystem::path(sb.binDir) / "hello-tool", "echo hello from $0");
    CommandResult r = manager->runCommand(sb, "hello-tool");
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_NE(r.stdoutText.find("hello from"), std::string::npos);
    manager->destroy(sb);
}

TEST_F(SandboxTest, CommandTimeout) {
    Sandbox sb = manager->create();
    CommandOptions opts;
    opts.timeoutMs = 300;
    CommandResult r = manager->runCommand(sb, "sleep 30", opts);
    EXPECT_TRUE(r.timedOut);
    manager->destroy(sb);
}

TEST(SandboxHelpersTest, CommandProgram) {
    EXPECT_EQ(commandProgram("pytest -v"), "pytest");
    EXPECT_EQ(commandProgram("CI=1 FOO=bar npm install"), "npm");
    EXPECT_EQ(commandProgram("  uv sync"), "uv");
    EXPECT_EQ(commandProgram("echo hi"), "");
    EXPECT_EQ(commandProgram("(cd x && make)"), "");
    EXPECT_EQ(commandProgram(""), "");
}

TEST(SandboxHelpersTest, LoaderHookVariables) {
    EXPECT_TRUE(isLoaderHookVariable("LD_PRELOAD"));
    EXPECT_TRUE(isLoaderHookVariable("LD_LIBRARY_PATH"));
    EXPECT_TRUE(isLoaderHookVariable("DYLD_INSERT_LIBRARIES"));
    EXPECT_TRUE(isLoaderHookVariable("PYTHONPATH"));
    EXPECT_FALSE(isLoaderHookVariable("PATH"));
    EXPECT_FALSE(isLoaderHookVariable("HOME"));
}
