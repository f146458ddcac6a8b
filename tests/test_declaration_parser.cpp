// EN: Unit tests for the YAML pipeline declaration parser and serialiser.
// FR: Tests unitaires du parser et sérialiseur YAML de déclaration de pipeline.

#include <gtest/gtest.h>
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

#include "declaration/declaration_parser.hpp"

using namespace CIP;
using namespace CIP::Declaration;

namespace {

const char* const RUST_WORKFLOW = R"(
name: Rust

on: [push, pull_request]

env:
  CARGO_TERM_COLOR: always

jobs:
  test:
    runs-on: ubuntu-latest
    steps:
      - uses: actions/checkout@v2
      - uses: dtolnay/rust-toolchain@master
        with:
          toolchain: stable
      - uses: Swatinem/rust-cache@v1
      - name: Run tests
        run: cargo test --verbose

  fmt:
    runs-on: ubuntu-latest
    steps:
      - uses: actions/checkout@v2
      - uses: dtolnay/rust-toolchain@nightly
        with:
          components: rustfmt
      - name: Check formatting
        run: cargo fmt --all -- --check

  coverage:
    runs-on: ubuntu-latest
    continue-on-error: true
    timeout-minutes: 30
    env:
      RUSTFLAGS: -Cinstrument-coverage
    steps:
      - uses: actions/checkout@v2
      - name: Generate report
        run: |
          cargo install grcov
          grcov . --output-path lcov.info
        env:
          LLVM_PROFILE_FILE: "cov-%p.profraw"
        working-directory: target
)";

std::string jobWithStep(const std::string& step_yaml) {
    return "jobs:\n  build:\n    steps:\n" + step_yaml;
}

} // namespace

class DeclarationParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / ("cip_declaration_" + testName());
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(DeclarationParserTest, ParsesJobsInDeclarationOrder) {
    Pipeline pipeline = DeclarationParser::parseString(RUST_WORKFLOW);

    EXPECT_EQ(pipeline.name, "Rust");
    ASSERT_EQ(pipeline.on.size(), 2u);
    EXPECT_EQ(pipeline.on[0], EventKind::PUSH);
    EXPECT_EQ(pipeline.on[1], EventKind::PULL_REQUEST);
    EXPECT_EQ(findParameter(pipeline.env, "CARGO_TERM_COLOR").value_or(""), "always");

    ASSERT_EQ(pipeline.jobs.size(), 3u);
    EXPECT_EQ(pipeline.jobs[0].id, "test");
    EXPECT_EQ(pipeline.jobs[1].id, "fmt");
    EXPECT_EQ(pipeline.jobs[2].id, "coverage");
}

TEST_F(DeclarationParserTest, ParsesStepsAndParameters) {
    Pipeline pipeline = DeclarationParser::parseString(RUST_WORKFLOW);

    const Job& test = pipeline.jobs[0];
    EXPECT_EQ(test.runs_on, "ubuntu-latest");
    ASSERT_EQ(test.steps.size(), 4u);
    ASSERT_TRUE(test.steps[1].uses.has_value());
    EXPECT_EQ(test.steps[1].uses->name, "dtolnay/rust-toolchain");
    EXPECT_EQ(test.steps[1].uses->version, "master");
    EXPECT_EQ(findParameter(test.steps[1].with, "toolchain").value_or(""), "stable");
    EXPECT_EQ(test.steps[3].name, "Run tests");
    EXPECT_EQ(test.steps[3].run.value_or(""), "cargo test --verbose");

    const Job& coverage = pipeline.jobs[2];
    EXPECT_TRUE(coverage.continue_on_error);
    ASSERT_TRUE(coverage.timeout.has_value());
    EXPECT_EQ(coverage.timeout->count(), 30);
    EXPECT_EQ(findParameter(coverage.env, "RUSTFLAGS").value_or(""), "-Cinstrument-coverage");

    const Step& report = coverage.steps[1];
    EXPECT_EQ(report.run.value_or(""), "cargo install grcov\ngrcov . --output-path lcov.info\n");
    EXPECT_EQ(findParameter(report.env, "LLVM_PROFILE_FILE").value_or(""), "cov-%p.profraw");
    EXPECT_EQ(report.working_directory, "target");
}

TEST_F(DeclarationParserTest, RoundTripPreservesOrderAndParameters) {
    Pipeline original = DeclarationParser::parseString(RUST_WORKFLOW);
    Pipeline reparsed = DeclarationParser::parseString(DeclarationParser::serialize(original));

    EXPECT_EQ(reparsed.name, original.name);
    EXPECT_EQ(reparsed.on, original.on);
    EXPECT_EQ(reparsed.env, original.env);
    ASSERT_EQ(reparsed.jobs.size(), original.jobs.size());

    for (size_t j = 0; j < original.jobs.size(); ++j) {
        const Job& a = original.jobs[j];
        const Job& b = reparsed.jobs[j];
        EXPECT_EQ(b.id, a.id);
        EXPECT_EQ(b.runs_on, a.runs_on);
        EXPECT_EQ(b.continue_on_error, a.continue_on_error);
        EXPECT_EQ(b.timeout, a.timeout);
        EXPECT_EQ(b.env, a.env);
        ASSERT_EQ(b.steps.size(), a.steps.size());
        for (size_t s = 0; s < a.steps.size(); ++s) {
            EXPECT_EQ(b.steps[s].name, a.steps[s].name);
            EXPECT_EQ(b.steps[s].uses, a.steps[s].uses);
            EXPECT_EQ(b.steps[s].with, a.steps[s].with);
            EXPECT_EQ(b.steps[s].run, a.steps[s].run);
            EXPECT_EQ(b.steps[s].env, a.steps[s].env);
            EXPECT_EQ(b.steps[s].working_directory, a.steps[s].working_directory);
        }
    }
}

TEST_F(DeclarationParserTest, RoundTripKeepsListValuedInputs) {
    Pipeline original = DeclarationParser::parseString(jobWithStep(
        "      - uses: actions/cache@v3\n"
        "        with:\n"
        "          path:\n"
        "            - target\n"
        "            - ~/.cargo\n"
        "          key: deps\n"));
    EXPECT_EQ(findParameter(original.jobs[0].steps[0].with, "path").value_or(""), "target\n~/.cargo");

    Pipeline reparsed = DeclarationParser::parseString(DeclarationParser::serialize(original));
    EXPECT_EQ(reparsed.jobs[0].steps[0].with, original.jobs[0].steps[0].with);
}

TEST_F(DeclarationParserTest, SaveAndParseFile) {
    Pipeline original = DeclarationParser::parseString(RUST_WORKFLOW);
    const std::string path = (test_dir_ / "ci.yml").string();

    DeclarationParser::saveToFile(path, original);
    Pipeline loaded = DeclarationParser::parseFile(path);

    ASSERT_EQ(loaded.jobs.size(), 3u);
    EXPECT_EQ(loaded.jobs[1].id, "fmt");
}

TEST_F(DeclarationParserTest, ParsesJobCacheBlock) {
    Pipeline pipeline = DeclarationParser::parseString(
        "jobs:\n"
        "  build:\n"
        "    cache:\n"
        "      key: build-{hash:Cargo.lock}\n"
        "      paths: [target, vendor]\n"
        "    steps:\n"
        "      - run: make\n");

    ASSERT_TRUE(pipeline.jobs[0].cache.has_value());
    EXPECT_EQ(pipeline.jobs[0].cache->key, "build-{hash:Cargo.lock}");
    EXPECT_EQ(pipeline.jobs[0].cache->paths, (std::vector<std::string>{"target", "vendor"}));
}

TEST_F(DeclarationParserTest, RejectsCachePathsOutsideWorkspace) {
    auto withPaths = [](const std::string& paths) {
        return "jobs:\n  build:\n    cache:\n      paths: " + paths + "\n    steps:\n      - run: make\n";
    };

    EXPECT_THROW(DeclarationParser::parseString(withPaths("[/home/ci/.cargo]")), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(withPaths("[target, ../shared]")), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(withPaths("target/../../x")), DeclarationError);
    EXPECT_NO_THROW(DeclarationParser::parseString(withPaths("[target/../vendor]")));
}

TEST_F(DeclarationParserTest, TriggerMappingUsesEventNames) {
    Pipeline pipeline = DeclarationParser::parseString(
        "on:\n"
        "  push:\n"
        "    branches: [master]\n"
        "  workflow_dispatch:\n"
        "jobs:\n"
        "  build:\n"
        "    steps:\n"
        "      - run: make\n");

    ASSERT_EQ(pipeline.on.size(), 2u);
    EXPECT_EQ(pipeline.on[1], EventKind::MANUAL);
}

TEST_F(DeclarationParserTest, RejectsMalformedDeclarations) {
    EXPECT_THROW(DeclarationParser::parseString("jobs: ["), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString("- a\n- b\n"), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString("name: empty\n"), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString("jobs:\n  build:\n    runs-on: x\n"), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString("on: tag\njobs:\n  a:\n    steps:\n      - run: x\n"),
                 DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString("jobs:\n  bad id:\n    steps:\n      - run: x\n"), DeclarationError);
}

TEST_F(DeclarationParserTest, RejectsInvalidSteps) {
    EXPECT_THROW(DeclarationParser::parseString(jobWithStep("      - name: nothing\n")), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(jobWithStep("      - run: make\n        uses: a@v1\n")),
                 DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(jobWithStep("      - uses: actions/checkout\n")), DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(jobWithStep("      - run: make\n        with:\n          a: b\n")),
                 DeclarationError);
    EXPECT_THROW(DeclarationParser::parseString(jobWithStep("      - run: make\n        retries: 3\n")),
                 DeclarationError);
}

TEST_F(DeclarationParserTest, RejectsJobDependencies) {
    try {
        DeclarationParser::parseString(
            "jobs:\n"
            "  a:\n"
            "    steps:\n"
            "      - run: x\n"
            "  b:\n"
            "    needs: a\n"
            "    steps:\n"
            "      - run: y\n");
        FAIL() << "needs should be rejected";
    } catch (const DeclarationError& e) {
        EXPECT_NE(std::string(e.what()).find("needs"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("line 6"), std::string::npos);
    }
}

TEST_F(DeclarationParserTest, RejectsNonPositiveTimeout) {
    EXPECT_THROW(DeclarationParser::parseString(
                     "jobs:\n  a:\n    timeout-minutes: 0\n    steps:\n      - run: x\n"),
                 DeclarationError);
}

TEST_F(DeclarationParserTest, MissingFileIsDeclarationError) {
    EXPECT_THROW(DeclarationParser::parseFile((test_dir_ / "missing.yml").string()), DeclarationError);
}

TEST(DeclarationParserIdTest, ValidatesJobIds) {
    EXPECT_TRUE(DeclarationParser::isValidJobId("clippy_check"));
    EXPECT_TRUE(DeclarationParser::isValidJobId("build-1"));
    EXPECT_FALSE(DeclarationParser::isValidJobId(""));
    EXPECT_FALSE(DeclarationParser::isValidJobId("has space"));
}
