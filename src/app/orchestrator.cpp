#include "app/orchestrator.hpp"

#include "log/log.hpp"

#include <filesystem>
#include <system_error>

namespace argrun::app {

namespace {

/// Path of the running executable, used as argv[0] for self re-entry.
std::optional<std::string> host_executable() {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        ARGRUN_LOG_WARN("run", "cannot resolve /proc/self/exe: " << ec.message());
        return std::nullopt;
    }
    return path.string();
}

} // namespace

Orchestrator::Orchestrator(const schema::CommandSpec& spec, Localization localization,
                           ExecMode mode)
    : spec_(spec), localization_(std::move(localization)), mode_(mode) {}

auto Orchestrator::describe(const state::CommandState& root,
                            const assemble::AssemblyError& error) const -> std::string {
    using Kind = assemble::AssemblyError::Kind;
    switch (error.kind) {
    case Kind::MissingRequired: {
        std::string name = error.arg_id;
        auto node = root.node_at(error.path);
        if (is_ok(node)) {
            if (const auto* arg = unwrap(node)->spec().find_arg(error.arg_id)) {
                name = arg->display_name;
            }
        }
        return localization_.required_message(name);
    }
    case Kind::MissingSubcommand:
        return localization_.get(error.message_id());
    case Kind::InvalidValue:
        return localization_.get(error.message_id()) + ": '" + error.value.value_or("") + "'";
    case Kind::Internal:
        return localization_.get(error.message_id());
    }
    return localization_.get("internal-error");
}

auto Orchestrator::finish(RunOutcome outcome) -> const RunOutcome& {
    outcome_ = std::move(outcome);
    return *outcome_;
}

auto Orchestrator::make_request(const assemble::Tokens& tokens, const RunInputs& inputs) const
    -> process::ExecRequest {
    process::ExecRequest request;
    request.argv = tokens;
    request.env_overrides = inputs.env;
    request.stdin_source = inputs.stdin_source;
    request.working_directory = inputs.working_directory;

    if (mode_ == ExecMode::SelfReentry) {
        if (auto exe = host_executable(); exe && !request.argv.empty()) {
            request.argv.front() = *exe;
        }
        request.env_overrides.emplace_back(CHILD_APP_ENV_VAR, "1");
    }
    return request;
}

auto Orchestrator::run(state::CommandState& root, const RunInputs& inputs) -> const RunOutcome& {
    root.clear_validation_errors();

    auto assembled = assemble::assemble(
        root, [&](const assemble::AssemblyError& error) { return describe(root, error); });
    if (is_err(assembled)) {
        auto& error = unwrap_err(assembled);
        std::string message = describe(root, error);
        if (error.is_validation()) {
            ARGRUN_LOG_DEBUG("run", "validation failed: " << message);
        } else {
            ARGRUN_LOG_ERROR("run", "schema defect at '" << error.arg_id << "'");
        }
        return finish(ValidationFailed{std::move(error), std::move(message)});
    }
    const assemble::Tokens& tokens = unwrap(assembled);

    for (const auto& [key, value] : inputs.env) {
        if (key.empty()) {
            return finish(EnvRejected{localization_.get("env-key-empty")});
        }
    }

    auto request = make_request(tokens, inputs);
    auto child = make_box<process::ChildProcess>();
    auto started = child->start(request);
    child_ = std::move(child);

    if (is_err(started)) {
        auto& error = unwrap_err(started);
        std::string message = localization_.get(error.message_id()) + ": " + error.message();
        return finish(SpawnRejected{std::move(error), std::move(message)});
    }

    pid_t pid = unwrap(started);
    ARGRUN_LOG_INFO("run", "running " << spec_.name << " as pid " << pid);
    return finish(RunStarted{pid});
}

void Orchestrator::kill() {
    if (child_) {
        child_->kill();
    }
}

auto Orchestrator::wait() -> std::optional<process::ProcessStatus> {
    if (!child_) {
        return std::nullopt;
    }
    return child_->wait();
}

auto Orchestrator::is_running() const -> bool {
    return child_ && child_->is_running();
}

} // namespace argrun::app
