#include "app/entry.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <iostream>

namespace argrun::app {

Session::Session(const schema::CommandSpec& spec, Settings settings)
    : spec_(spec), settings_(std::move(settings)), state_(spec),
      orchestrator_(spec, settings_.localization, settings_.mode) {}

auto Session::run(const RunInputs& inputs) -> const RunOutcome& {
    RunInputs effective;
    if (settings_.enable_env) {
        effective.env = inputs.env;
    }
    if (settings_.enable_stdin) {
        effective.stdin_source = inputs.stdin_source;
    }
    if (settings_.enable_working_dir) {
        effective.working_directory = inputs.working_directory;
    }
    return orchestrator_.run(state_, effective);
}

auto run_app(const schema::CommandSpec& spec, Settings settings, int argc, char* argv[],
             const MatchesCallback& on_matches, const HostCallback& host) -> int {
    if (std::getenv(CHILD_APP_ENV_VAR) != nullptr) {
        // Cleared so programs started by the child do not inherit the role
        if (::unsetenv(CHILD_APP_ENV_VAR) != 0) {
            ARGRUN_LOG_WARN("app", "cannot clear " << CHILD_APP_ENV_VAR);
        }

        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) {
            tokens.emplace_back(argv[i]);
        }
        auto matches = matcher::match_args(spec, tokens);
        if (is_err(matches)) {
            std::cerr << "error: " << unwrap_err(matches).message() << "\n";
            return 2;
        }
        ARGRUN_LOG_DEBUG("app", "child mode, " << tokens.size() << " arguments");
        return on_matches(unwrap(matches));
    }

    ARGRUN_LOG_DEBUG("app", "host mode for " << spec.name);
    Session session(spec, std::move(settings));
    return host(session);
}

} // namespace argrun::app
