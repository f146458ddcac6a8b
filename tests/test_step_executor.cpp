// EN: Unit tests for the step executor: commands, actions, expansion and cancellation.
// FR: Tests unitaires de l'exécuteur d'étapes : commandes, actions, expansion et annulation.

#include <gtest/gtest.h>
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

#include "execution/builtin_actions.hpp"
#include "execution/step_executor.hpp"

using namespace CIP;
using namespace CIP::Execution;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class StepExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / ("cip_step_executor_" + testName());
        fs::remove_all(base_);
        fs::create_directories(base_ / "source");
        std::ofstream(base_ / "source" / "Cargo.toml") << "[package]\n";

        registerBuiltinActions(registry_, ToolchainOptions{});
        run_.run_id = "run-7";
        run_.source_directory = (base_ / "source").string();
        environment_ = std::make_unique<JobEnvironment>("fmt", (base_ / "workspaces").string());
    }

    void TearDown() override {
        environment_.reset();
        fs::remove_all(base_);
    }

    static Step command(const std::string& run) {
        Step step;
        step.run = run;
        return step;
    }

    static Step action(const std::string& reference) {
        Step step;
        step.uses = ActionReference::parse(reference);
        return step;
    }

    fs::path base_;
    ActionRegistry registry_;
    ProcessRunner runner_{500ms};
    StepExecutor executor_{registry_, runner_};
    RunContext run_;
    std::unique_ptr<JobEnvironment> environment_;
};

TEST_F(StepExecutorTest, SuccessfulCommandReturnsRecord) {
    Step step = command("echo formatted");
    step.name = "Check formatting";

    StepRecord record = executor_.execute(step, 3, *environment_, run_);

    EXPECT_EQ(record.index, 3u);
    EXPECT_EQ(record.name, "Check formatting");
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_EQ(record.stdout_data, "formatted\n");
}

TEST_F(StepExecutorTest, NonZeroExitThrowsStepFailureWithOutput) {
    try {
        executor_.execute(command("echo Diff in src/main.rs; echo bad >&2; exit 1"), 2, *environment_, run_);
        FAIL() << "non-zero exit should throw";
    } catch (const StepFailure& e) {
        EXPECT_EQ(e.exitCode(), 1);
        EXPECT_EQ(e.stdoutData(), "Diff in src/main.rs\n");
        EXPECT_EQ(e.stderrData(), "bad\n");
        EXPECT_NE(std::string(e.what()).find("Step 2"), std::string::npos);
    }
}

TEST_F(StepExecutorTest, StepEnvironmentOverridesJobEnvironment) {
    environment_->setVariable("MODE", "job");
    environment_->setVariable("TOOL", "cargo");

    Step step = command("echo \"$MODE $TOOL\"");
    step.env = {{"MODE", "step-${{ env.TOOL }}"}};

    StepRecord record = executor_.execute(step, 0, *environment_, run_);
    EXPECT_EQ(record.stdout_data, "step-cargo cargo\n");
    EXPECT_EQ(environment_->getVariable("MODE").value_or(""), "job");
}

TEST_F(StepExecutorTest, ExpandsEnvironmentExpressions) {
    environment_->setVariable("TOOLCHAIN", "nightly");

    EXPECT_EQ(StepExecutor::expandExpressions("rustup run ${{ env.TOOLCHAIN }} cargo", *environment_),
              "rustup run nightly cargo");
    EXPECT_EQ(StepExecutor::expandExpressions("${{env.TOOLCHAIN}}-${{ env.MISSING }}", *environment_), "nightly-");
    EXPECT_EQ(StepExecutor::expandExpressions("plain $HOME", *environment_), "plain $HOME");
}

TEST_F(StepExecutorTest, RunsInWorkingDirectoryInsideWorkspace) {
    fs::create_directories(environment_->workspace() / "target");
    Step step = command("pwd");
    step.working_directory = "target";

    StepRecord record = executor_.execute(step, 0, *environment_, run_);
    EXPECT_EQ(record.stdout_data, fs::canonical(environment_->workspace() / "target").string() + "\n");
}

TEST_F(StepExecutorTest, MissingWorkingDirectoryFailsStep) {
    Step step = command("true");
    step.working_directory = "missing";
    EXPECT_THROW(executor_.execute(step, 0, *environment_, run_), StepFailure);

    step.working_directory = "../escape";
    EXPECT_THROW(executor_.execute(step, 0, *environment_, run_), StepFailure);
}

TEST_F(StepExecutorTest, UnsupportedActionVersionIsRejected) {
    EXPECT_THROW(executor_.execute(action("actions/checkout@v99"), 0, *environment_, run_), UnknownActionError);
    EXPECT_THROW(executor_.execute(action("someone/deploy@v1"), 0, *environment_, run_), UnknownActionError);
}

TEST_F(StepExecutorTest, CheckoutActionPopulatesWorkspace) {
    StepRecord record = executor_.execute(action("actions/checkout@v2"), 0, *environment_, run_);

    EXPECT_EQ(record.exit_code, 0);
    EXPECT_EQ(record.name, "actions/checkout@v2");
    EXPECT_TRUE(fs::exists(environment_->workspace() / "Cargo.toml"));
}

TEST_F(StepExecutorTest, FailedActionThrowsStepFailure) {
    run_.source_directory = (base_ / "missing").string();
    EXPECT_THROW(executor_.execute(action("actions/checkout@v2"), 0, *environment_, run_), StepFailure);
}

TEST_F(StepExecutorTest, CancelledTokenStopsBeforeStep) {
    CancellationToken token;
    token.cancel("fail-fast");

    try {
        executor_.execute(command("touch should-not-exist"), 0, *environment_, run_, &token);
        FAIL() << "cancelled token should throw";
    } catch (const CancelledError& e) {
        EXPECT_NE(std::string(e.what()).find("fail-fast"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(environment_->workspace() / "should-not-exist"));
}

TEST_F(StepExecutorTest, CancellationDuringStepThrowsCancelled) {
    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(200ms);
        token.cancel("timeout");
    });

    EXPECT_THROW(executor_.execute(command("sleep 30"), 0, *environment_, run_, &token), CancelledError);
    canceller.join();
}
