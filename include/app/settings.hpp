//! # Settings and Localization
//!
//! Host-side options that are not part of the wrapped command schema.
//!
//! ## Settings File
//!
//! A subset of TOML:
//!
//! ```toml
//! # comments are allowed
//! [settings]
//! enable_env = "Variables passed to the program"
//! enable_stdin = ""
//! mode = "external"            # or "self-reentry"
//!
//! [localization]
//! run = "Uruchom"
//! required-prefix = "Argument '"
//! required-suffix = "' jest wymagany"
//! ```
//!
//! Every value is a basic string. A `[localization]` key must be a known
//! message id.

#ifndef ARGRUN_APP_SETTINGS_HPP
#define ARGRUN_APP_SETTINGS_HPP

#include "common.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace argrun::app {

/// Message-id -> display string table with English defaults.
class Localization {
public:
    Localization();

    /// Text for `id`; the id itself when it is unknown.
    [[nodiscard]] auto get(std::string_view id) const -> std::string;

    /// Replaces the text of a known id. Returns false for unknown ids.
    auto set(std::string_view id, std::string text) -> bool;

    [[nodiscard]] auto knows(std::string_view id) const -> bool;

    /// "Argument '<name>' is required" built from the prefix and suffix parts.
    [[nodiscard]] auto required_message(std::string_view display_name) const -> std::string;

    std::string required_prefix = "Argument '";
    std::string required_suffix = "' is required";

private:
    std::map<std::string, std::string, std::less<>> messages_;
};

/// How the orchestrator launches the wrapped program.
enum class ExecMode {
    SelfReentry, ///< Re-run the host executable with the child marker set
    External     ///< `argv[0]` is a program of its own
};

struct Settings {
    /// Each description, when present, enables that input section of the
    /// presentation layer and is shown above it (empty: no description).
    std::optional<std::string> enable_env;
    std::optional<std::string> enable_stdin;
    std::optional<std::string> enable_working_dir;
    Localization localization;
    ExecMode mode = ExecMode::SelfReentry;
};

/// Settings file problem with its 1-based line (0 when not line specific).
struct ConfigError {
    int line;
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Parses settings text. Missing keys keep their defaults.
[[nodiscard]] auto parse_settings(std::string_view text) -> Result<Settings, ConfigError>;

/// Reads and parses a settings file.
[[nodiscard]] auto load_settings(const std::filesystem::path& path)
    -> Result<Settings, ConfigError>;

} // namespace argrun::app

#endif // ARGRUN_APP_SETTINGS_HPP
