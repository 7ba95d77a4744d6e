//! # Execution Orchestrator
//!
//! Turns a "run" request from the presentation layer into a child process.
//!
//! ## Run Sequence
//!
//! 1. Clear all validation errors in the state tree.
//! 2. Assemble the argument vector. Failures (including values outside an
//!    argument's allowed set) are painted onto the offending value and the
//!    run stops.
//! 3. Reject environment overrides with an empty key.
//! 4. Spawn the child and make it the tracked process. A previous child is
//!    not killed; it keeps running untracked.

#ifndef ARGRUN_APP_ORCHESTRATOR_HPP
#define ARGRUN_APP_ORCHESTRATOR_HPP

#include "app/settings.hpp"
#include "assemble/assembler.hpp"
#include "common.hpp"
#include "process/child_process.hpp"
#include "schema/command_spec.hpp"
#include "state/command_state.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace argrun::app {

/// Marker variable that tells a re-entered host it is the child.
constexpr const char* CHILD_APP_ENV_VAR = "ARGRUN_CHILD_APP";

/// Inputs besides the argument tree; each enabled by a `Settings` section.
struct RunInputs {
    std::vector<process::EnvPair> env;
    std::optional<process::StdinSource> stdin_source;
    std::optional<std::string> working_directory;
};

struct RunStarted {
    pid_t pid;
};

/// Assembly failure; `message` is already painted on the tree when the
/// error names an argument.
struct ValidationFailed {
    assemble::AssemblyError error;
    std::string message;
};

struct EnvRejected {
    std::string message;
};

struct SpawnRejected {
    process::SpawnError error;
    std::string message;
};

using RunOutcome = std::variant<RunStarted, ValidationFailed, EnvRejected, SpawnRejected>;

class Orchestrator {
public:
    /// `spec` must outlive the orchestrator.
    Orchestrator(const schema::CommandSpec& spec, Localization localization, ExecMode mode);

    /// Runs the sequence above against `root`.
    auto run(state::CommandState& root, const RunInputs& inputs) -> const RunOutcome&;

    /// Kills the tracked child. No-op when nothing runs.
    void kill();

    [[nodiscard]] auto is_running() const -> bool;

    /// Blocks until the tracked child has finished and its output is
    /// complete. nullopt before the first spawn attempt.
    auto wait() -> std::optional<process::ProcessStatus>;

    /// Tracked child, or nullptr before the first spawn attempt.
    [[nodiscard]] auto handle() const -> const process::ChildProcess* {
        return child_.get();
    }

    [[nodiscard]] auto last_outcome() const -> const std::optional<RunOutcome>& {
        return outcome_;
    }

    /// Builds the request that `run` would spawn for `tokens` (program name
    /// first), applying the execution mode.
    [[nodiscard]] auto make_request(const assemble::Tokens& tokens, const RunInputs& inputs) const
        -> process::ExecRequest;

private:
    auto finish(RunOutcome outcome) -> const RunOutcome&;
    [[nodiscard]] auto describe(const state::CommandState& root,
                                const assemble::AssemblyError& error) const -> std::string;

    const schema::CommandSpec& spec_;
    Localization localization_;
    ExecMode mode_;
    Box<process::ChildProcess> child_;
    std::optional<RunOutcome> outcome_;
};

} // namespace argrun::app

#endif // ARGRUN_APP_ORCHESTRATOR_HPP
