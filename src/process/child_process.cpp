//! # Child Process Supervisor Implementation
//!
//! fork + execvp with pipe-based output capture. The child reports exec
//! failures over a close-on-exec pipe: if the pipe closes without data the
//! exec succeeded.

#include "process/child_process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <pthread.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace argrun::process {

namespace {

/// Owning file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() {
        reset();
    }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.release()) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const {
        return fd_;
    }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

/// Returns 0 or the errno of pipe2.
int make_pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return errno;
    }
    read_end = Fd(fds[0]);
    write_end = Fd(fds[1]);
    return 0;
}

// Stage codes the child writes to the error pipe
constexpr int STAGE_CHDIR = 1;
constexpr int STAGE_EXEC = 2;

/// Host environment with `overrides` applied, as "KEY=VALUE" strings.
std::vector<std::string> build_environment(const std::vector<EnvPair>& overrides) {
    std::vector<std::string> entries;
    for (char** var = environ; var && *var; ++var) {
        entries.emplace_back(*var);
    }
    for (const auto& [key, value] : overrides) {
        std::string prefix = key + "=";
        bool replaced = false;
        for (auto& entry : entries) {
            if (entry.starts_with(prefix)) {
                entry = prefix + value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            entries.push_back(prefix + value);
        }
    }
    return entries;
}

std::vector<char*> to_pointers(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

/// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(char** argv, char** envp, const char* working_dir, int stdin_fd,
                             int stdout_fd, int stderr_fd, int report_fd) {
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    // Own process group so kill() also reaches grandchildren
    setpgid(0, 0);

    dup2(stdin_fd, STDIN_FILENO);
    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);

    int report[2] = {0, 0};
    if (working_dir && ::chdir(working_dir) != 0) {
        report[0] = STAGE_CHDIR;
        report[1] = errno;
    } else {
        environ = envp;
        execvp(argv[0], argv);
        report[0] = STAGE_EXEC;
        report[1] = errno;
    }
    [[maybe_unused]] ssize_t n = ::write(report_fd, report, sizeof(report));
    _exit(127);
}

} // namespace

// ============================================================================
// SpawnError
// ============================================================================

auto SpawnError::message_id() const -> const char* {
    return kind == Kind::EmptyEnvKey ? "env-key-empty" : "spawn-failed";
}

auto SpawnError::message() const -> std::string {
    std::string reason =
        error_code != 0 ? ": " + std::generic_category().message(error_code) : std::string();
    switch (kind) {
    case Kind::EmptyArgv:
        return "no program to execute";
    case Kind::EmptyEnvKey:
        return "environment variable with an empty name";
    case Kind::ExecutableNotFound:
        return "executable '" + detail + "' not found" + reason;
    case Kind::PermissionDenied:
        return "cannot execute '" + detail + "'" + reason;
    case Kind::StdinFile:
        return "cannot open stdin file '" + detail + "'" + reason;
    case Kind::WorkingDirectory:
        return "cannot enter working directory '" + detail + "'" + reason;
    case Kind::Io:
        return "spawn failed (" + detail + ")" + reason;
    }
    return "spawn failed";
}

auto status_name(const ProcessStatus& status) -> const char* {
    return std::visit(
        [](const auto& s) -> const char* {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, NotStarted>) {
                return "not-started";
            } else if constexpr (std::is_same_v<T, Running>) {
                return "running";
            } else if constexpr (std::is_same_v<T, Exited>) {
                return "exited";
            } else if constexpr (std::is_same_v<T, Killed>) {
                return "killed";
            } else {
                return "spawn-failed";
            }
        },
        status);
}

// ============================================================================
// ChildProcess
// ============================================================================

ChildProcess::ChildProcess() : shared_(make_rc<Shared>()) {}

ChildProcess::~ChildProcess() {
    bool done;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        done = shared_->finished();
    }
    for (auto& thread : threads_) {
        if (!thread.joinable()) {
            continue;
        }
        if (done) {
            thread.join();
        } else {
            thread.detach();
        }
    }
}

void ChildProcess::fail(SpawnError error) {
    ARGRUN_LOG_WARN("process", error.message());
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->status = SpawnFailed{std::move(error)};
}

auto ChildProcess::start(const ExecRequest& request) -> Result<pid_t, SpawnError> {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!std::holds_alternative<NotStarted>(shared_->status)) {
            return SpawnError{SpawnError::Kind::Io, 0, "handle already started"};
        }
    }

    // Invalid requests leave the handle untouched
    if (request.argv.empty()) {
        return SpawnError{SpawnError::Kind::EmptyArgv, 0, ""};
    }
    for (const auto& [key, value] : request.env_overrides) {
        if (key.empty()) {
            ARGRUN_LOG_DEBUG("process", "rejected empty environment key (value '" << value
                                                                                  << "')");
            return SpawnError{SpawnError::Kind::EmptyEnvKey, 0, value};
        }
    }

    std::vector<std::string> args = request.argv;
    std::vector<char*> argv_ptrs = to_pointers(args);
    std::vector<std::string> env = build_environment(request.env_overrides);
    std::vector<char*> env_ptrs = to_pointers(env);
    const char* working_dir = nullptr;
    if (request.working_directory && !request.working_directory->empty()) {
        working_dir = request.working_directory->c_str();
    }

    auto fail_with = [this](SpawnError::Kind kind, int code, std::string detail) {
        SpawnError error{kind, code, std::move(detail)};
        fail(error);
        return error;
    };

    // stdin: file opened here so a bad path is a spawn error, inline text
    // goes through a pipe, otherwise /dev/null
    Fd child_stdin;
    Fd stdin_writer;
    std::optional<std::string> stdin_text;
    if (request.stdin_source) {
        if (const auto* file = std::get_if<StdinFile>(&*request.stdin_source)) {
            child_stdin = Fd(::open(file->path.c_str(), O_RDONLY | O_CLOEXEC));
            if (child_stdin.get() < 0) {
                return fail_with(SpawnError::Kind::StdinFile, errno, file->path);
            }
        } else {
            if (int err = make_pipe(child_stdin, stdin_writer); err != 0) {
                return fail_with(SpawnError::Kind::Io, err, "stdin pipe");
            }
            stdin_text = std::get<InlineText>(*request.stdin_source).text;
        }
    } else {
        child_stdin = Fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (child_stdin.get() < 0) {
            return fail_with(SpawnError::Kind::Io, errno, "/dev/null");
        }
    }

    Fd stdout_read, stdout_write, stderr_read, stderr_write, report_read, report_write;
    if (int err = make_pipe(stdout_read, stdout_write); err != 0) {
        return fail_with(SpawnError::Kind::Io, err, "stdout pipe");
    }
    if (int err = make_pipe(stderr_read, stderr_write); err != 0) {
        return fail_with(SpawnError::Kind::Io, err, "stderr pipe");
    }
    if (int err = make_pipe(report_read, report_write); err != 0) {
        return fail_with(SpawnError::Kind::Io, err, "error pipe");
    }

    pid_t pid = fork();
    if (pid < 0) {
        return fail_with(SpawnError::Kind::Io, errno, "fork");
    }
    if (pid == 0) {
        exec_child(argv_ptrs.data(), env_ptrs.data(), working_dir, child_stdin.get(),
                   stdout_write.get(), stderr_write.get(), report_write.get());
    }

    // Parent: drop the child's ends
    child_stdin.reset();
    stdout_write.reset();
    stderr_write.reset();
    report_write.reset();

    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(report_read.get(), report, sizeof(report));
    } while (n < 0 && errno == EINTR);

    if (n != 0) {
        int raw_status = 0;
        while (::waitpid(pid, &raw_status, 0) < 0 && errno == EINTR) {
        }
        if (n < 0) {
            return fail_with(SpawnError::Kind::Io, errno, "error pipe read");
        }
        if (report[0] == STAGE_CHDIR) {
            return fail_with(SpawnError::Kind::WorkingDirectory, report[1], working_dir);
        }
        SpawnError::Kind kind = SpawnError::Kind::Io;
        if (report[1] == ENOENT) {
            kind = SpawnError::Kind::ExecutableNotFound;
        } else if (report[1] == EACCES || report[1] == EPERM) {
            kind = SpawnError::Kind::PermissionDenied;
        }
        return fail_with(kind, report[1], request.argv.front());
    }

    ARGRUN_LOG_INFO("process", "started pid " << pid << ": " << request.argv.front());

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->status = Running{pid};
        shared_->open_streams = 2;
    }
    threads_.emplace_back(&ChildProcess::read_stream, shared_, stdout_read.release());
    threads_.emplace_back(&ChildProcess::read_stream, shared_, stderr_read.release());
    threads_.emplace_back(&ChildProcess::wait_for_exit, shared_, pid);
    if (stdin_text) {
        if (stdin_text->empty()) {
            stdin_writer.reset();
        } else {
            threads_.emplace_back(&ChildProcess::write_stdin, stdin_writer.release(),
                                  std::move(*stdin_text));
        }
    }
    return pid;
}

auto ChildProcess::spawn(const ExecRequest& request) -> Result<Box<ChildProcess>, SpawnError> {
    auto child = make_box<ChildProcess>();
    auto started = child->start(request);
    if (is_err(started)) {
        return unwrap_err(started);
    }
    return std::move(child);
}

void ChildProcess::read_stream(Rc<Shared> shared, int fd) {
    Fd stream(fd);
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(stream.get(), buffer, sizeof(buffer));
        if (n > 0) {
            shared->output.append(std::string_view(buffer, static_cast<size_t>(n)));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            if (n < 0) {
                ARGRUN_LOG_WARN("process", "output stream read failed: "
                                               << std::generic_category().message(errno));
            }
            break;
        }
    }
    stream.reset();

    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        --shared->open_streams;
    }
    shared->cv.notify_all();
}

void ChildProcess::wait_for_exit(Rc<Shared> shared, pid_t pid) {
    // Observe termination without reaping, so kill() can never signal a
    // recycled pid: the zombie is reaped below while holding the mutex.
    siginfo_t info{};
    bool observed = true;
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            ARGRUN_LOG_ERROR("process", "waitid(" << pid << ") failed: "
                                                  << std::generic_category().message(errno));
            observed = false;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        int raw_status = 0;
        while (::waitpid(pid, &raw_status, 0) < 0 && errno == EINTR) {
        }

        if (!observed) {
            shared->status = Exited{-1};
        } else if (info.si_code == CLD_EXITED) {
            shared->status = Exited{info.si_status};
        } else if (shared->kill_requested && info.si_status == SIGKILL) {
            shared->status = Killed{};
        } else {
            shared->status = Exited{128 + info.si_status};
        }
        ARGRUN_LOG_INFO("process", "pid " << pid << " " << status_name(shared->status));
    }
    shared->cv.notify_all();
}

void ChildProcess::write_stdin(int fd, std::string text) {
    Fd stream(fd);

    // A child that exits without reading turns our write into SIGPIPE
    sigset_t pipe_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, nullptr);

    bool broken = false;
    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(stream.get(), text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                broken = true;
            } else {
                ARGRUN_LOG_WARN("process", "stdin write failed: "
                                               << std::generic_category().message(errno));
            }
            break;
        }
        written += static_cast<size_t>(n);
    }
    stream.reset();

    if (broken) {
        ARGRUN_LOG_DEBUG("process", "child closed stdin after " << written << " bytes");
        timespec zero{0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {
        }
    }
}

auto ChildProcess::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return std::holds_alternative<Running>(shared_->status);
}

void ChildProcess::kill() {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    const auto* running = std::get_if<Running>(&shared_->status);
    if (!running) {
        return;
    }
    if (!shared_->kill_requested) {
        pid_t pid = running->pid;
        if (::kill(-pid, SIGKILL) != 0 && ::kill(pid, SIGKILL) != 0) {
            ARGRUN_LOG_ERROR("process", "kill(" << pid << ") failed: "
                                                << std::generic_category().message(errno));
            return;
        }
        shared_->kill_requested = true;
        ARGRUN_LOG_INFO("process", "sent SIGKILL to pid " << pid);
    }
    shared_->cv.wait(lock, [this] { return !std::holds_alternative<Running>(shared_->status); });
}

auto ChildProcess::wait() -> ProcessStatus {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    if (std::holds_alternative<NotStarted>(shared_->status) ||
        std::holds_alternative<SpawnFailed>(shared_->status)) {
        return shared_->status;
    }
    shared_->cv.wait(lock, [this] { return shared_->finished(); });
    return shared_->status;
}

auto ChildProcess::status() const -> ProcessStatus {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->status;
}

auto ChildProcess::output_snapshot() const -> std::string {
    return shared_->output.snapshot();
}

auto ChildProcess::output() const -> const OutputBuffer& {
    return shared_->output;
}

auto ChildProcess::pid() const -> std::optional<pid_t> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (const auto* running = std::get_if<Running>(&shared_->status)) {
        return running->pid;
    }
    return std::nullopt;
}

} // namespace argrun::process
