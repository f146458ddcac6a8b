// EN: Unit tests for the process runner: exit codes, output capture and group termination.
// FR: Tests unitaires du process runner : codes de sortie, capture de sortie et terminaison de groupe.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "execution/process_runner.hpp"

using namespace CIP;
using namespace CIP::Execution;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    ProcessRequest request(const std::string& command) {
        ProcessRequest req;
        req.command = command;
        req.environment = {"PATH=/usr/local/bin:/usr/bin:/bin", "GREETING=hello"};
        return req;
    }

    ProcessRunner runner_{500ms};
};

TEST_F(ProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
    ProcessResult result = runner_.run(request("echo out; echo err >&2"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
}

TEST_F(ProcessRunnerTest, ReportsExitCode) {
    ProcessResult result = runner_.run(request("exit 3"));

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(result.cancelled);
}

TEST_F(ProcessRunnerTest, StopsAtFirstFailingCommand) {
    ProcessResult result = runner_.run(request("echo first\nfalse\necho never"));

    EXPECT_NE(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "first\n");
}

TEST_F(ProcessRunnerTest, PassesEnvironmentBlockOnly) {
    ProcessResult result = runner_.run(request("echo \"$GREETING\"; echo \"${HOME:-unset}\""));

    EXPECT_EQ(result.stdout_data, "hello\nunset\n");
}

TEST_F(ProcessRunnerTest, RunsInWorkingDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "cip_process_runner_wd";
    std::filesystem::create_directories(dir);

    ProcessRequest req = request("pwd");
    req.working_directory = dir.string();
    ProcessResult result = runner_.run(req);

    EXPECT_EQ(result.stdout_data, std::filesystem::canonical(dir).string() + "\n");
    std::filesystem::remove_all(dir);
}

TEST_F(ProcessRunnerTest, MissingWorkingDirectoryExits126) {
    ProcessRequest req = request("true");
    req.working_directory = "/nonexistent/cip/dir";

    EXPECT_EQ(runner_.run(req).exit_code, 126);
}

TEST_F(ProcessRunnerTest, MissingShellExits127) {
    ProcessRequest req = request("true");
    req.shell = "no-such-shell-cip";

    ProcessResult result = runner_.run(req);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_data.find("shell not found"), std::string::npos);
}

TEST_F(ProcessRunnerTest, StreamsOutputToCallback) {
    std::mutex mutex;
    std::string streamed;
    ProcessRunner runner(500ms);
    runner.setOutputCallback([&](OutputStream stream, const std::string& chunk) {
        if (stream == OutputStream::STDOUT) {
            std::lock_guard<std::mutex> lock(mutex);
            streamed += chunk;
        }
    });

    runner.run(request("echo a; echo b"));
    EXPECT_EQ(streamed, "a\nb\n");
}

TEST_F(ProcessRunnerTest, AlreadyCancelledTokenSkipsSpawn) {
    CancellationToken token;
    token.cancel("stop");

    ProcessResult result = runner_.run(request("echo should-not-run"), &token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.stdout_data.empty());
}

TEST_F(ProcessRunnerTest, CancellationTerminatesProcessGroup) {
    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(200ms);
        token.cancel("test");
    });

    auto start = std::chrono::steady_clock::now();
    ProcessResult result = runner_.run(request("sleep 30 & sleep 30; wait"), &token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.succeeded());
    EXPECT_GE(result.exit_code, 128);
    EXPECT_LT(elapsed, 10s);
}

TEST_F(ProcessRunnerTest, IgnoredSigtermEscalatesToSigkill) {
    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(200ms);
        token.cancel("test");
    });

    ProcessResult result = runner_.run(request("trap '' TERM; while true; do sleep 0.1; done"), &token);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

TEST_F(ProcessRunnerTest, OrphanedBackgroundProcessDoesNotBlock) {
    auto start = std::chrono::steady_clock::now();
    ProcessResult result = runner_.run(request("sleep 30 & echo done"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "done\n");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(ProcessRunnerResolveTest, SearchesPathOfEnvironmentBlock) {
    EXPECT_EQ(ProcessRunner::resolveExecutable("/bin/sh", {}), "/bin/sh");
    EXPECT_FALSE(ProcessRunner::resolveExecutable("sh", {"PATH=/usr/bin:/bin"}).empty());
    EXPECT_TRUE(ProcessRunner::resolveExecutable("no-such-binary-cip", {"PATH=/usr/bin:/bin"}).empty());
}
