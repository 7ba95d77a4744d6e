//! # Child Process Supervisor
//!
//! Launches one external program and tracks it until it terminates.
//!
//! ## Threads
//!
//! | Thread        | Job                                                   |
//! |---------------|-------------------------------------------------------|
//! | stdout reader | drains the stdout pipe into the output buffer         |
//! | stderr reader | drains the stderr pipe into the output buffer         |
//! | waiter        | observes termination, reaps the child, sets `status`  |
//! | stdin writer  | only for inline stdin text; closes the pipe when done |
//!
//! All of them hold a reference to one shared state block, so a handle can be
//! dropped while its child is still running: the threads are detached and the
//! waiter still reaps the child.
//!
//! ## Status
//!
//! ```text
//! NotStarted --start--> Running --exit--> Exited(code)
//!     |                     \--kill()--> Killed
//!     \--failure--> SpawnFailed(error)
//! ```
//!
//! A child terminated by a signal the supervisor did not send reports
//! `Exited(128 + signo)`.
//!
//! POSIX only.

#ifndef ARGRUN_PROCESS_CHILD_PROCESS_HPP
#define ARGRUN_PROCESS_CHILD_PROCESS_HPP

#include "common.hpp"
#include "process/exec_request.hpp"
#include "process/output_buffer.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <variant>
#include <vector>

namespace argrun::process {

/// Why a child could not be launched.
struct SpawnError {
    enum class Kind {
        EmptyArgv,          ///< Nothing to execute
        EmptyEnvKey,        ///< An environment override has an empty key
        ExecutableNotFound, ///< `argv[0]` not found in PATH
        PermissionDenied,   ///< `argv[0]` found but not executable
        StdinFile,          ///< The stdin file could not be opened
        WorkingDirectory,   ///< chdir into the working directory failed
        Io                  ///< pipe/fork failure or a reused handle
    };

    Kind kind;
    int error_code = 0; ///< errno of the failing call, 0 if none
    std::string detail; ///< Path, key or executable the error is about

    /// Localization message id shown to the user.
    [[nodiscard]] auto message_id() const -> const char*;

    /// English diagnostic for logs.
    [[nodiscard]] auto message() const -> std::string;
};

struct NotStarted {};
struct Running {
    pid_t pid;
};
struct Exited {
    int code;
};
struct Killed {};
struct SpawnFailed {
    SpawnError error;
};

using ProcessStatus = std::variant<NotStarted, Running, Exited, Killed, SpawnFailed>;

/// Lowercase name of a status alternative ("running", "exited", ...).
[[nodiscard]] auto status_name(const ProcessStatus& status) -> const char*;

class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    /// Launches `request`. On an invalid request (empty argv, empty env key)
    /// the status stays `NotStarted`; any later failure sets `SpawnFailed`.
    /// A handle can be started once. Returns the child's pid.
    [[nodiscard]] auto start(const ExecRequest& request) -> Result<pid_t, SpawnError>;

    /// Creates a handle and starts it.
    [[nodiscard]] static auto spawn(const ExecRequest& request)
        -> Result<Box<ChildProcess>, SpawnError>;

    /// Non-blocking liveness check.
    [[nodiscard]] auto is_running() const -> bool;

    /// Sends SIGKILL to the child's process group and returns once the waiter
    /// has recorded `Killed`. No-op unless the child is running.
    void kill();

    /// Blocks until the child has terminated and both output streams are
    /// closed. Returns immediately for handles that never ran.
    auto wait() -> ProcessStatus;

    [[nodiscard]] auto status() const -> ProcessStatus;

    /// Copy of everything captured from stdout and stderr so far.
    [[nodiscard]] auto output_snapshot() const -> std::string;

    [[nodiscard]] auto output() const -> const OutputBuffer&;

    /// Process id while running, otherwise nullopt.
    [[nodiscard]] auto pid() const -> std::optional<pid_t>;

private:
    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable cv;
        ProcessStatus status = NotStarted{};
        OutputBuffer output;
        bool kill_requested = false;
        int open_streams = 0;

        [[nodiscard]] auto finished() const -> bool {
            return !std::holds_alternative<Running>(status) && open_streams == 0;
        }
    };

    static void read_stream(Rc<Shared> shared, int fd);
    static void wait_for_exit(Rc<Shared> shared, pid_t pid);
    static void write_stdin(int fd, std::string text);

    void fail(SpawnError error);

    Rc<Shared> shared_;
    std::vector<std::thread> threads_;
};

} // namespace argrun::process

#endif // ARGRUN_PROCESS_CHILD_PROCESS_HPP
