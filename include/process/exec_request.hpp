//! # Execution Request
//!
//! Everything needed to launch one child process.

#ifndef ARGRUN_PROCESS_EXEC_REQUEST_HPP
#define ARGRUN_PROCESS_EXEC_REQUEST_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace argrun::process {

/// Text written to the child's stdin, which is closed afterwards.
struct InlineText {
    std::string text;
};

/// File whose contents become the child's stdin.
struct StdinFile {
    std::string path;
};

using StdinSource = std::variant<InlineText, StdinFile>;

using EnvPair = std::pair<std::string, std::string>;

struct ExecRequest {
    /// `argv[0]` is the executable (searched in PATH), the rest its arguments.
    std::vector<std::string> argv;
    /// Applied on top of the inherited environment; later entries win.
    std::vector<EnvPair> env_overrides;
    /// Absent: the child reads from /dev/null.
    std::optional<StdinSource> stdin_source;
    /// Absent or empty: inherit the host's working directory.
    std::optional<std::string> working_directory;
};

} // namespace argrun::process

#endif // ARGRUN_PROCESS_EXEC_REQUEST_HPP
