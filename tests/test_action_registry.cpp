// EN: Unit tests for the action registry and the built-in checkout, toolchain and cache actions.
// FR: Tests unitaires du registre d'actions et des actions intégrées checkout, toolchain et cache.

#include <gtest/gtest.h>
#include "test_support.hpp"
#include <gmock/gmock.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

#include "execution/action_registry.hpp"
#include "execution/builtin_actions.hpp"

using namespace CIP;
using namespace CIP::Execution;
using ::testing::_;
using ::testing::Return;

namespace fs = std::filesystem;

class MockActionHandler : public ActionHandler {
public:
    MOCK_METHOD(std::string, description, (), (const, override));
    MOCK_METHOD(ActionOutcome, execute, (ActionContext& context), (override));
};

namespace {

Step actionStep(const std::string& reference, Parameters with = {}) {
    Step step;
    step.uses = ActionReference::parse(reference);
    step.with = std::move(with);
    return step;
}

} // namespace

TEST(ActionRegistryTest, ResolvesRegisteredVersions) {
    ActionRegistry registry;
    auto handler = std::make_shared<MockActionHandler>();
    registry.registerAction("actions/checkout", {"v2", "v3"}, handler);

    EXPECT_EQ(&registry.resolve(ActionReference{"actions/checkout", "v2"}), handler.get());
    EXPECT_EQ(registry.find(ActionReference{"actions/checkout", "v3"}), handler.get());
    EXPECT_TRUE(registry.hasAction("actions/checkout"));
    EXPECT_EQ(registry.supportedVersions("actions/checkout"), (std::vector<std::string>{"v2", "v3"}));
}

TEST(ActionRegistryTest, UnknownVersionFailsClosed) {
    ActionRegistry registry;
    registry.registerAction("actions/checkout", {"v2"}, std::make_shared<MockActionHandler>());

    EXPECT_EQ(registry.find(ActionReference{"actions/checkout", "v9"}), nullptr);
    try {
        registry.resolve(ActionReference{"actions/checkout", "v9"});
        FAIL() << "unsupported version should be rejected";
    } catch (const UnknownActionError& e) {
        EXPECT_NE(std::string(e.what()).find("actions/checkout@v9"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("v2"), std::string::npos);
    }
}

TEST(ActionRegistryTest, UnknownNameFailsClosed) {
    ActionRegistry registry;
    EXPECT_THROW(registry.resolve(ActionReference{"someone/deploy", "v1"}), UnknownActionError);
    EXPECT_FALSE(registry.hasAction("someone/deploy"));
}

TEST(ActionRegistryTest, EmptyVersionListAcceptsAnyVersion) {
    ActionRegistry registry;
    auto handler = std::make_shared<MockActionHandler>();
    registry.registerAction("cip/toolchain", {}, handler);

    EXPECT_EQ(registry.find(ActionReference{"cip/toolchain", "nightly"}), handler.get());
    EXPECT_EQ(registry.find(ActionReference{"cip/toolchain", "1.70.0"}), handler.get());
}

TEST(ActionRegistryTest, RejectsIncompleteRegistration) {
    ActionRegistry registry;
    EXPECT_THROW(registry.registerAction("", {"v1"}, std::make_shared<MockActionHandler>()), std::invalid_argument);
    EXPECT_THROW(registry.registerAction("x/y", {"v1"}, nullptr), std::invalid_argument);
}

TEST(BuiltinActionsTest, RegistersClosedSet) {
    ActionRegistry registry;
    registerBuiltinActions(registry, ToolchainOptions{});

    EXPECT_NE(registry.find(ActionReference{"actions/checkout", "v2"}), nullptr);
    EXPECT_NE(registry.find(ActionReference{"dtolnay/rust-toolchain", "nightly"}), nullptr);
    EXPECT_NE(registry.find(ActionReference{"Swatinem/rust-cache", "v1"}), nullptr);
    EXPECT_NE(registry.find(ActionReference{"actions/cache", "v3"}), nullptr);
    EXPECT_EQ(registry.find(ActionReference{"Swatinem/rust-cache", "v7"}), nullptr);
}

TEST(BuiltinActionsTest, ToolchainNameResolution) {
    EXPECT_EQ(ToolchainAction::toolchainName(ActionReference{"dtolnay/rust-toolchain", "master"},
                                             {{"toolchain", "stable"}}), "stable");
    EXPECT_EQ(ToolchainAction::toolchainName(ActionReference{"dtolnay/rust-toolchain", "nightly"}, {}), "nightly");
    EXPECT_EQ(ToolchainAction::toolchainName(ActionReference{"dtolnay/rust-toolchain", "master"}, {}), "");
}

TEST(BuiltinActionsTest, RustCacheDefaultsToTargetDirectory) {
    ActionRegistry registry;
    registerBuiltinActions(registry, ToolchainOptions{});

    Step step = actionStep("Swatinem/rust-cache@v1");
    auto spec = registry.resolve(*step.uses).cacheSpec(step);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->paths, (std::vector<std::string>{"target"}));
    EXPECT_EQ(spec->key, "{job}-{os}-{hash:Cargo.lock}");
}

TEST(BuiltinActionsTest, GenericCacheNeedsPaths) {
    ActionRegistry registry;
    registerBuiltinActions(registry, ToolchainOptions{});

    Step bare = actionStep("actions/cache@v3");
    EXPECT_FALSE(registry.resolve(*bare.uses).cacheSpec(bare).has_value());

    Step configured = actionStep("actions/cache@v3", {{"path", "target\n  vendor  "}, {"key", "deps-{ref}"}});
    auto spec = registry.resolve(*configured.uses).cacheSpec(configured);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->paths, (std::vector<std::string>{"target", "vendor"}));
    EXPECT_EQ(spec->key, "deps-{ref}");
}

class BuiltinActionContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / ("cip_builtin_actions_" + testName());
        fs::remove_all(base_);
        source_ = base_ / "source";
        fs::create_directories(source_ / "src");
        fs::create_directories(source_ / ".git");
        std::ofstream(source_ / "Cargo.toml") << "[package]\nname = \"demo\"\n";
        std::ofstream(source_ / "src" / "main.rs") << "fn main() {}\n";
        std::ofstream(source_ / ".git" / "HEAD") << "ref: refs/heads/master\n";

        run_.run_id = "run-1";
        run_.source_directory = source_.string();
        environment_ = std::make_unique<JobEnvironment>("test", (base_ / "workspaces").string());
    }

    void TearDown() override {
        environment_.reset();
        fs::remove_all(base_);
    }

    ActionOutcome execute(ActionHandler& handler, const Step& step) {
        ActionContext context{step, step.with, *environment_, run_, runner_, nullptr};
        return handler.execute(context);
    }

    fs::path base_;
    fs::path source_;
    RunContext run_;
    ProcessRunner runner_{std::chrono::milliseconds(500)};
    std::unique_ptr<JobEnvironment> environment_;
};

TEST_F(BuiltinActionContextTest, CheckoutCopiesSourceWithoutGitDirectory) {
    CheckoutAction checkout;
    ActionOutcome outcome = execute(checkout, actionStep("actions/checkout@v2"));

    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_TRUE(fs::exists(environment_->workspace() / "Cargo.toml"));
    EXPECT_TRUE(fs::exists(environment_->workspace() / "src" / "main.rs"));
    EXPECT_FALSE(fs::exists(environment_->workspace() / ".git"));
    EXPECT_EQ(environment_->getVariable("CIP_CHECKOUT_PATH").value_or(""), environment_->workspace().string());
}

TEST_F(BuiltinActionContextTest, CheckoutIntoSubdirectory) {
    CheckoutAction checkout;
    ActionOutcome outcome = execute(checkout, actionStep("actions/checkout@v2", {{"path", "repo"},
                                                                               {"include-git", "true"}}));

    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_TRUE(fs::exists(environment_->workspace() / "repo" / "Cargo.toml"));
    EXPECT_TRUE(fs::exists(environment_->workspace() / "repo" / ".git" / "HEAD"));
}

TEST_F(BuiltinActionContextTest, CheckoutFailsWithoutSource) {
    run_.source_directory = (base_ / "missing").string();
    CheckoutAction checkout;
    ActionOutcome outcome = execute(checkout, actionStep("actions/checkout@v2"));

    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.exit_code, 0);
}

TEST_F(BuiltinActionContextTest, ToolchainUsesInstalledBinDirectory) {
    fs::create_directories(base_ / "toolchains" / "nightly" / "bin");
    ToolchainOptions options;
    options.root = (base_ / "toolchains").string();
    options.allow_host = false;
    ToolchainAction toolchain(options);

    ActionOutcome outcome = execute(toolchain, actionStep("dtolnay/rust-toolchain@nightly",
                                                          {{"components", "rustfmt"}}));

    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(environment_->getVariable("PATH").value_or("").rfind((base_ / "toolchains" / "nightly" / "bin").string(), 0),
              0u);
    EXPECT_EQ(environment_->getVariable("CIP_TOOLCHAIN").value_or(""), "nightly");
    EXPECT_EQ(environment_->getVariable("CIP_TOOLCHAIN_COMPONENTS").value_or(""), "rustfmt");
}

TEST_F(BuiltinActionContextTest, ToolchainInstallerExitCodeIsHonoured) {
    ToolchainOptions options;
    options.root = (base_ / "toolchains").string();
    options.install_command = "mkdir -p \"$CIP_TOOLCHAIN_ROOT/$CIP_TOOLCHAIN/bin\"";
    options.allow_host = false;
    ToolchainAction installer(options);

    ActionOutcome installed = execute(installer, actionStep("dtolnay/rust-toolchain@master", {{"toolchain", "stable"}}));
    ASSERT_TRUE(installed.success) << installed.message;
    EXPECT_TRUE(fs::is_directory(base_ / "toolchains" / "stable" / "bin"));

    options.install_command = "echo no such toolchain >&2; exit 4";
    ToolchainAction failing(options);
    ActionOutcome failed = execute(failing, actionStep("dtolnay/rust-toolchain@beta"));
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.exit_code, 4);
}

TEST_F(BuiltinActionContextTest, ToolchainWithoutHostFallbackFails) {
    ToolchainOptions options;
    options.allow_host = false;
    ToolchainAction toolchain(options);

    EXPECT_FALSE(execute(toolchain, actionStep("dtolnay/rust-toolchain@nightly")).success);
    EXPECT_FALSE(execute(toolchain, actionStep("dtolnay/rust-toolchain@master")).success);
}

TEST_F(BuiltinActionContextTest, CacheActionExportsHitFlag) {
    CacheAction cache({"target"}, "{job}");

    environment_->setCacheHit(true);
    ActionOutcome outcome = execute(cache, actionStep("Swatinem/rust-cache@v1"));

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(environment_->getVariable("CIP_CACHE_HIT").value_or(""), "true");
}
