//! # Argument Matcher
//!
//! Parses an argument vector against a `schema::CommandSpec`. The re-entered
//! child process parses its own argv with it before handing control to the
//! wrapped program (`app::run_app`).
//!
//! ## Accepted Syntax
//!
//! | Form            | Meaning                                      |
//! |-----------------|----------------------------------------------|
//! | `--name value`  | value for `--name`                           |
//! | `--name=value`  | value for `--name`                           |
//! | `-n value`      | value for `-n`                               |
//! | `-nvalue`       | value for `-n`                               |
//! | `-abc`          | short flags/counters `-a -b -c`              |
//! | `word`          | sub-command name, else the next positional   |
//! | `--`            | everything after is positional               |
//!
//! A sub-command name consumes the rest of the vector. A single-value
//! argument given twice keeps the last value.

#ifndef ARGRUN_MATCHER_ARG_MATCHES_HPP
#define ARGRUN_MATCHER_ARG_MATCHES_HPP

#include "common.hpp"
#include "schema/command_spec.hpp"
#include "state/command_state.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace argrun::matcher {

/// Where a matched value came from.
enum class ValueSource { CommandLine, Default };

/// Parse result for one command level.
class ArgMatches {
public:
    explicit ArgMatches(std::string command) : command_(std::move(command)) {}

    [[nodiscard]] auto command() const -> const std::string& {
        return command_;
    }

    /// True when the argument occurred or received a default value.
    [[nodiscard]] auto contains(std::string_view id) const -> bool;

    /// Last value of a single- or multiple-value argument.
    [[nodiscard]] auto get_one(std::string_view id) const -> std::optional<std::string>;

    /// All values of an argument in order (empty when absent).
    [[nodiscard]] auto get_many(std::string_view id) const -> std::vector<std::string>;

    /// Value of a boolean flag: true when it occurred at least once, or the
    /// reverse for a set-false flag (`--no-color` is true until given).
    [[nodiscard]] auto get_flag(std::string_view id) const -> bool;

    /// Number of occurrences of a counter (or any argument).
    [[nodiscard]] auto get_count(std::string_view id) const -> uint32_t;

    [[nodiscard]] auto value_source(std::string_view id) const -> std::optional<ValueSource>;

    [[nodiscard]] auto subcommand_name() const -> const std::optional<std::string>& {
        return subcommand_name_;
    }

    /// Matches of the selected sub-command, or nullptr.
    [[nodiscard]] auto subcommand_matches() const -> const ArgMatches* {
        return subcommand_.get();
    }

private:
    friend class Matcher;

    std::string command_;
    std::map<std::string, std::vector<std::string>, std::less<>> values_;
    std::map<std::string, uint32_t, std::less<>> occurrences_;
    std::map<std::string, ValueSource, std::less<>> sources_;
    std::set<std::string, std::less<>> negated_;
    std::optional<std::string> subcommand_name_;
    Box<ArgMatches> subcommand_;
};

/// Why an argument vector does not fit the schema.
struct MatchError {
    enum class Kind {
        UnknownArgument,      ///< Token names no argument of the command
        MissingValue,         ///< Value-taking argument at the end of the vector
        UnexpectedValue,      ///< `--flag=value` on a flag or counter
        InvalidValue,         ///< Value outside the allowed set
        UnexpectedPositional, ///< More positional words than declared
        MissingRequired,      ///< Required argument absent and without default
        MissingSubcommand     ///< Required sub-command absent
    };

    Kind kind;
    std::string arg_id; ///< Offending argument id when known
    std::string token;  ///< Offending token or value
    state::CommandPath path;

    [[nodiscard]] auto message() const -> std::string;
};

/// Recursive-descent parser over one token vector.
class Matcher {
public:
    Matcher(const schema::CommandSpec& spec, const std::vector<std::string>& tokens)
        : root_(spec), tokens_(tokens) {}

    [[nodiscard]] auto parse() -> Result<ArgMatches, MatchError>;

private:
    [[nodiscard]] auto parse_command(const schema::CommandSpec& spec, ArgMatches& out)
        -> std::optional<MatchError>;
    [[nodiscard]] auto parse_long(const schema::CommandSpec& spec, std::string_view token,
                                  ArgMatches& out) -> std::optional<MatchError>;
    [[nodiscard]] auto parse_short_cluster(const schema::CommandSpec& spec,
                                           std::string_view token, ArgMatches& out)
        -> std::optional<MatchError>;
    [[nodiscard]] auto record_value(const schema::ArgSpec& arg, std::string value,
                                    ArgMatches& out) -> std::optional<MatchError>;
    [[nodiscard]] auto take_next_value(const schema::ArgSpec& arg)
        -> std::optional<std::string>;
    [[nodiscard]] auto finish(const schema::CommandSpec& spec, ArgMatches& out)
        -> std::optional<MatchError>;

    [[nodiscard]] auto error(MatchError::Kind kind, std::string arg_id, std::string token) const
        -> MatchError {
        return MatchError{kind, std::move(arg_id), std::move(token), path_};
    }

    const schema::CommandSpec& root_;
    const std::vector<std::string>& tokens_;
    size_t pos_ = 0;
    bool options_done_ = false;
    state::CommandPath path_;
};

/// Parses `tokens` (without the program name) against `spec`.
[[nodiscard]] auto match_args(const schema::CommandSpec& spec,
                              const std::vector<std::string>& tokens)
    -> Result<ArgMatches, MatchError>;

} // namespace argrun::matcher

#endif // ARGRUN_MATCHER_ARG_MATCHES_HPP
