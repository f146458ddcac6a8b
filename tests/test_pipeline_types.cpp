// EN: Unit tests for pipeline data model helpers and cancellation tokens.
// FR: Tests unitaires des utilitaires du modèle de données et des tokens d'annulation.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/pipeline_types.hpp"

using namespace CIP;
using namespace std::chrono_literals;

TEST(ParametersTest, SetParameterKeepsPositionOfExistingKey) {
    Parameters params{{"a", "1"}, {"b", "2"}};
    setParameter(params, "a", "10");
    setParameter(params, "c", "3");

    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(params[0].first, "a");
    EXPECT_EQ(params[0].second, "10");
    EXPECT_EQ(params[2].first, "c");
    EXPECT_EQ(findParameter(params, "b").value_or(""), "2");
    EXPECT_FALSE(findParameter(params, "missing").has_value());
}

TEST(EventKindTest, ParsesDeclarationSpellings) {
    EXPECT_EQ(parseEventKind("push"), EventKind::PUSH);
    EXPECT_EQ(parseEventKind("pull_request"), EventKind::PULL_REQUEST);
    EXPECT_EQ(parseEventKind("workflow_dispatch"), EventKind::MANUAL);
    EXPECT_EQ(toString(EventKind::MANUAL), "manual");
    EXPECT_THROW(parseEventKind("tag"), std::invalid_argument);
}

TEST(ActionReferenceTest, SplitsOnLastAt) {
    auto ref = ActionReference::parse("Swatinem/rust-cache@v1");
    EXPECT_EQ(ref.name, "Swatinem/rust-cache");
    EXPECT_EQ(ref.version, "v1");
    EXPECT_EQ(ref.toString(), "Swatinem/rust-cache@v1");

    EXPECT_THROW(ActionReference::parse("actions/checkout"), std::invalid_argument);
    EXPECT_THROW(ActionReference::parse("@v1"), std::invalid_argument);
    EXPECT_THROW(ActionReference::parse("actions/checkout@"), std::invalid_argument);
}

TEST(StepTest, DisplayNameFallsBackToReferenceOrFirstCommandLine) {
    Step named;
    named.name = "Build";
    named.run = "cargo build";
    EXPECT_EQ(named.displayName(), "Build");

    Step action;
    action.uses = ActionReference{"actions/checkout", "v2"};
    EXPECT_EQ(action.displayName(), "actions/checkout@v2");

    Step command;
    command.run = "cargo fmt\ncargo clippy";
    EXPECT_EQ(command.displayName(), "cargo fmt");
}

TEST(PipelineTest, EmptyTriggerListAcceptsEveryEvent) {
    Pipeline pipeline;
    EXPECT_TRUE(pipeline.acceptsEvent(EventKind::PULL_REQUEST));

    pipeline.on = {EventKind::PUSH};
    EXPECT_TRUE(pipeline.acceptsEvent(EventKind::PUSH));
    EXPECT_FALSE(pipeline.acceptsEvent(EventKind::PULL_REQUEST));
}

TEST(PipelineResultTest, FailedJobsIgnoreContinueOnErrorFailures) {
    PipelineResult result;
    RunResult ok;
    ok.job_id = "test";
    ok.status = JobStatus::SUCCESS;
    RunResult tolerated;
    tolerated.job_id = "coverage";
    tolerated.status = JobStatus::FAILURE;
    tolerated.continue_on_error = true;
    RunResult cancelled;
    cancelled.job_id = "clippy";
    cancelled.status = JobStatus::CANCELLED;
    cancelled.continue_on_error = true;
    result.jobs = {ok, tolerated, cancelled};

    auto failed = result.failedJobs();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0], "clippy");
}

TEST(ErrorsTest, KindsAreStable) {
    EXPECT_STREQ(UnknownActionError("x@v9").kind(), "UnknownActionError");
    EXPECT_STREQ(StepFailure("boom", 3).kind(), "StepFailure");
    EXPECT_STREQ(CancelledError("stop").kind(), "Cancelled");

    StepFailure failure("boom", 3, "out", "err");
    EXPECT_EQ(failure.exitCode(), 3);
    EXPECT_EQ(failure.stdoutData(), "out");
    EXPECT_EQ(failure.stderrData(), "err");
    EXPECT_EQ(CacheWriteError("k", "disk full").key(), "k");
}

TEST(CancellationTokenTest, FirstReasonWins) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    token.cancel("first");
    token.cancel("second");
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), "first");
}

TEST(CancellationTokenTest, ChildSeesParentCancellation) {
    auto parent = std::make_shared<CancellationToken>();
    CancellationToken child(parent);
    CancellationToken sibling(parent);

    child.cancel("timeout");
    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent->isCancelled());
    EXPECT_FALSE(sibling.isCancelled());

    parent->cancel("user");
    EXPECT_TRUE(sibling.isCancelled());
    EXPECT_EQ(sibling.reason(), "user");
}

TEST(CancellationTokenTest, WaitForWakesOnCancel) {
    auto parent = std::make_shared<CancellationToken>();
    CancellationToken child(parent);

    EXPECT_FALSE(child.waitFor(30ms));

    std::thread canceller([parent]() {
        std::this_thread::sleep_for(50ms);
        parent->cancel("stop");
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(child.waitFor(5000ms));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
    canceller.join();
}
