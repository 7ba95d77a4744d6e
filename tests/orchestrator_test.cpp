//! # Orchestrator and Entry Tests
//!
//! Runs use `ExecMode::External` with `echo` as the wrapped program, so the
//! test binary is never re-entered.

#include "app/entry.hpp"
#include "app/orchestrator.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace argrun;
using namespace argrun::app;
using schema::ArgDef;
using schema::CommandDef;

class OrchestratorTest : public ::testing::Test {
protected:
    schema::CommandSpec spec;

    void SetUp() override {
        CommandDef root("echo");
        root.arg(ArgDef("style").long_name("style").possible_values({"plain", "loud"}))
            .arg(ArgDef("text").required());
        auto result = schema::build_spec(root);
        ASSERT_TRUE(is_ok(result));
        spec = std::move(unwrap(result));
    }
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(OrchestratorTest, MissingRequiredIsPainted) {
    state::CommandState root(spec);
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    const auto* failed = std::get_if<ValidationFailed>(&outcome);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error.kind, assemble::AssemblyError::Kind::MissingRequired);
    EXPECT_EQ(failed->message, "Argument 'Text' is required");
    EXPECT_EQ(root.value("text")->validation_error, "Argument 'Text' is required");
    EXPECT_EQ(orchestrator.handle(), nullptr);
    EXPECT_FALSE(orchestrator.wait().has_value());
}

TEST_F(OrchestratorTest, DisallowedValueIsPainted) {
    state::CommandState root(spec);
    ASSERT_TRUE(is_ok(root.set_single("style", "weird")));
    ASSERT_TRUE(is_ok(root.set_single("text", "hi")));
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    const auto* failed = std::get_if<ValidationFailed>(&outcome);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error.kind, assemble::AssemblyError::Kind::InvalidValue);
    EXPECT_EQ(failed->message, "Invalid value: 'weird'");
    EXPECT_EQ(root.value("style")->validation_error, "Invalid value: 'weird'");
    EXPECT_FALSE(root.value("text")->validation_error.has_value());
}

TEST_F(OrchestratorTest, NextRunClearsOldErrors) {
    state::CommandState root(spec);
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);
    orchestrator.run(root, {});
    ASSERT_TRUE(root.value("text")->validation_error.has_value());

    // Set through the tree without an edit-time clear
    root.apply_validation_error("style", "stale");
    ASSERT_TRUE(is_ok(root.set_single("text", "hi")));
    const auto& outcome = orchestrator.run(root, {});
    orchestrator.wait();

    EXPECT_TRUE(std::holds_alternative<RunStarted>(outcome));
    EXPECT_FALSE(root.value("style")->validation_error.has_value());
}

TEST_F(OrchestratorTest, LocalizedRequiredMessage) {
    Localization loc;
    loc.required_prefix = "Pole '";
    loc.required_suffix = "' jest wymagane";
    state::CommandState root(spec);
    Orchestrator orchestrator(spec, loc, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    ASSERT_TRUE(std::holds_alternative<ValidationFailed>(outcome));
    EXPECT_EQ(std::get<ValidationFailed>(outcome).message, "Pole 'Text' jest wymagane");
}

TEST_F(OrchestratorTest, EmptyEnvKeyRejectedBeforeSpawn) {
    state::CommandState root(spec);
    ASSERT_TRUE(is_ok(root.set_single("text", "hi")));
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);

    RunInputs inputs;
    inputs.env = {{"OK", "1"}, {"", "orphan"}};
    const auto& outcome = orchestrator.run(root, inputs);

    const auto* rejected = std::get_if<EnvRejected>(&outcome);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->message, "Environment variable can't be empty");
    EXPECT_EQ(orchestrator.handle(), nullptr);
}

// ============================================================================
// Spawning
// ============================================================================

TEST_F(OrchestratorTest, RunStartsChildWithAssembledArgv) {
    state::CommandState root(spec);
    ASSERT_TRUE(is_ok(root.set_single("style", "loud")));
    ASSERT_TRUE(is_ok(root.set_single("text", "hello")));
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    const auto* started = std::get_if<RunStarted>(&outcome);
    ASSERT_NE(started, nullptr);
    EXPECT_GT(started->pid, 0);

    auto status = orchestrator.wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(std::holds_alternative<process::Exited>(*status));
    ASSERT_NE(orchestrator.handle(), nullptr);
    EXPECT_EQ(orchestrator.handle()->output_snapshot(), "--style loud hello\n");
    EXPECT_FALSE(orchestrator.is_running());
    EXPECT_TRUE(orchestrator.last_outcome().has_value());
}

TEST_F(OrchestratorTest, PositionalStartingWithDashIsSpawned) {
    state::CommandState root(spec);
    ASSERT_TRUE(is_ok(root.set_single("text", "-5")));
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    ASSERT_TRUE(std::holds_alternative<RunStarted>(outcome));
    orchestrator.wait();
    EXPECT_EQ(orchestrator.handle()->output_snapshot(), "-5\n");
    EXPECT_FALSE(root.value("text")->validation_error.has_value());
}

TEST(OrchestratorSpawnTest, SpawnFailureReplacesHandle) {
    CommandDef def("argrun-no-such-program-xyz");
    auto spec = schema::build_spec(def);
    ASSERT_TRUE(is_ok(spec));
    state::CommandState root(unwrap(spec));
    Orchestrator orchestrator(unwrap(spec), Localization{}, ExecMode::External);

    const auto& outcome = orchestrator.run(root, {});

    const auto* rejected = std::get_if<SpawnRejected>(&outcome);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->error.kind, process::SpawnError::Kind::ExecutableNotFound);
    EXPECT_EQ(rejected->message.rfind("Could not start the program: ", 0), 0u);
    ASSERT_NE(orchestrator.handle(), nullptr);
    EXPECT_TRUE(std::holds_alternative<process::SpawnFailed>(orchestrator.handle()->status()));
}

TEST_F(OrchestratorTest, KillTrackedChild) {
    CommandDef def("sleep");
    def.arg(ArgDef("seconds").required());
    auto sleep_spec = schema::build_spec(def);
    ASSERT_TRUE(is_ok(sleep_spec));
    state::CommandState root(unwrap(sleep_spec));
    ASSERT_TRUE(is_ok(root.set_single("seconds", "30")));
    Orchestrator orchestrator(unwrap(sleep_spec), Localization{}, ExecMode::External);

    ASSERT_TRUE(std::holds_alternative<RunStarted>(orchestrator.run(root, {})));
    EXPECT_TRUE(orchestrator.is_running());

    orchestrator.kill();

    EXPECT_FALSE(orchestrator.is_running());
    EXPECT_TRUE(std::holds_alternative<process::Killed>(orchestrator.handle()->status()));
}

TEST_F(OrchestratorTest, SelfReentryRequest) {
    Orchestrator orchestrator(spec, Localization{}, ExecMode::SelfReentry);
    RunInputs inputs;
    inputs.env = {{"A", "1"}};

    auto request = orchestrator.make_request({"echo", "hi"}, inputs);

    ASSERT_EQ(request.argv.size(), 2u);
    EXPECT_NE(request.argv[0], "echo");
    EXPECT_EQ(request.argv[1], "hi");
    ASSERT_EQ(request.env_overrides.size(), 2u);
    EXPECT_EQ(request.env_overrides.back(), (process::EnvPair{CHILD_APP_ENV_VAR, "1"}));
}

TEST_F(OrchestratorTest, ExternalRequestKeepsProgramName) {
    Orchestrator orchestrator(spec, Localization{}, ExecMode::External);
    RunInputs inputs;
    inputs.working_directory = "/tmp";

    auto request = orchestrator.make_request({"echo", "hi"}, inputs);

    EXPECT_EQ(request.argv, (std::vector<std::string>{"echo", "hi"}));
    EXPECT_TRUE(request.env_overrides.empty());
    EXPECT_EQ(request.working_directory, "/tmp");
}

// ============================================================================
// Session
// ============================================================================

TEST_F(OrchestratorTest, SessionIgnoresDisabledInputs) {
    Settings settings;
    settings.mode = ExecMode::External;
    Session session(spec, settings);
    ASSERT_TRUE(is_ok(session.state().set_single("text", "hi")));

    RunInputs inputs;
    inputs.env = {{"", "ignored"}};
    inputs.working_directory = "/nonexistent/argrun/dir";
    const auto& outcome = session.run(inputs);
    session.orchestrator().wait();

    EXPECT_TRUE(std::holds_alternative<RunStarted>(outcome));
}

TEST_F(OrchestratorTest, SessionAppliesEnabledInputs) {
    Settings settings;
    settings.mode = ExecMode::External;
    settings.enable_env = "";
    Session session(spec, settings);
    ASSERT_TRUE(is_ok(session.state().set_single("text", "hi")));

    RunInputs inputs;
    inputs.env = {{"", "orphan"}};

    EXPECT_TRUE(std::holds_alternative<EnvRejected>(session.run(inputs)));
}

// ============================================================================
// run_app
// ============================================================================

TEST_F(OrchestratorTest, RunAppHostMode) {
    ::unsetenv(CHILD_APP_ENV_VAR);
    char arg0[] = "echo";
    char* argv[] = {arg0};
    bool host_called = false;

    int code = run_app(
        spec, Settings{}, 1, argv, [](const matcher::ArgMatches&) { return 10; },
        [&](Session& session) {
            host_called = true;
            EXPECT_EQ(session.spec().name, "echo");
            return 0;
        });

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(host_called);
}

TEST_F(OrchestratorTest, RunAppChildModeMatchesArgv) {
    ::setenv(CHILD_APP_ENV_VAR, "1", 1);
    char arg0[] = "echo";
    char arg1[] = "--style=plain";
    char arg2[] = "words";
    char* argv[] = {arg0, arg1, arg2};
    std::string seen;

    int code = run_app(
        spec, Settings{}, 3, argv,
        [&](const matcher::ArgMatches& matches) {
            seen = matches.get_one("text").value_or("") + "/" +
                   matches.get_one("style").value_or("");
            return 7;
        },
        [](Session&) { return 0; });

    EXPECT_EQ(code, 7);
    EXPECT_EQ(seen, "words/plain");
    EXPECT_EQ(std::getenv(CHILD_APP_ENV_VAR), nullptr);
}

TEST_F(OrchestratorTest, RunAppChildModeRejectsBadArgv) {
    ::setenv(CHILD_APP_ENV_VAR, "1", 1);
    char arg0[] = "echo";
    char arg1[] = "--unknown";
    char* argv[] = {arg0, arg1};

    int code = run_app(
        spec, Settings{}, 2, argv, [](const matcher::ArgMatches&) { return 0; },
        [](Session&) { return 0; });

    EXPECT_EQ(code, 2);
    ::unsetenv(CHILD_APP_ENV_VAR);
}
