//! # Application Entry
//!
//! `run_app` is called from the wrapped program's `main`. The same binary
//! plays two roles:
//!
//! - **Host**: no marker variable. A `Session` is built and handed to the
//!   presentation layer's event loop, which edits the state tree and asks the
//!   orchestrator to run.
//! - **Child**: the host re-executed itself with `ARGRUN_CHILD_APP` set. The
//!   marker is cleared, argv is matched against the schema and the program's
//!   real work runs with the matches.
//!
//! ```cpp
//! int main(int argc, char* argv[]) {
//!     auto spec = unwrap(schema::build_spec(define_cli()));
//!     return app::run_app(spec, app::Settings{}, argc, argv,
//!                         [](const matcher::ArgMatches& m) { return do_work(m); },
//!                         [](app::Session& session) { return event_loop(session); });
//! }
//! ```

#ifndef ARGRUN_APP_ENTRY_HPP
#define ARGRUN_APP_ENTRY_HPP

#include "app/orchestrator.hpp"
#include "app/settings.hpp"
#include "matcher/arg_matches.hpp"
#include "schema/command_spec.hpp"
#include "state/command_state.hpp"

#include <functional>

namespace argrun::app {

/// Host-side state: the editable tree, the orchestrator and the settings.
class Session {
public:
    /// `spec` must outlive the session.
    Session(const schema::CommandSpec& spec, Settings settings);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] auto spec() const -> const schema::CommandSpec& {
        return spec_;
    }
    [[nodiscard]] auto settings() const -> const Settings& {
        return settings_;
    }
    [[nodiscard]] auto state() -> state::CommandState& {
        return state_;
    }
    [[nodiscard]] auto state() const -> const state::CommandState& {
        return state_;
    }
    [[nodiscard]] auto orchestrator() -> Orchestrator& {
        return orchestrator_;
    }

    /// Runs the current tree. Inputs whose section is disabled in the
    /// settings are ignored.
    auto run(const RunInputs& inputs) -> const RunOutcome&;

private:
    const schema::CommandSpec& spec_;
    Settings settings_;
    state::CommandState state_;
    Orchestrator orchestrator_;
};

using MatchesCallback = std::function<int(const matcher::ArgMatches&)>;
using HostCallback = std::function<int(Session&)>;

/// Dispatches on the marker variable as described above and returns the
/// process exit code. A child whose argv does not match prints the error to
/// stderr and returns 2.
auto run_app(const schema::CommandSpec& spec, Settings settings, int argc, char* argv[],
             const MatchesCallback& on_matches, const HostCallback& host) -> int;

} // namespace argrun::app

#endif // ARGRUN_APP_ENTRY_HPP
