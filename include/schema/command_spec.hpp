//! # Command Schema
//!
//! Immutable description of a command-line interface: one `ArgSpec` per
//! declared argument and one nested `CommandSpec` per sub-command
//! alternative.
//!
//! ## Construction
//!
//! Hosts describe their CLI with the `CommandDef` / `ArgDef` builders and call
//! `build_spec()` once at startup:
//!
//! ```cpp
//! auto spec = build_spec(CommandDef("convert")
//!                            .arg(ArgDef("input").required())
//!                            .arg(ArgDef("verbose").short_name('v').action(ArgAction::Count))
//!                            .subcommand(CommandDef("png").arg(ArgDef("quality").long_name("quality"))));
//! ```
//!
//! The builder rejects schemas the assembler could not serialize (a flag or
//! counter without an invocation token, duplicate ids), so a built
//! `CommandSpec` never carries those defects.

#ifndef ARGRUN_SCHEMA_COMMAND_SPEC_HPP
#define ARGRUN_SCHEMA_COMMAND_SPEC_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argrun::schema {

// ============================================================================
// Argument Metadata
// ============================================================================

/// How many values an argument holds and how it serializes.
enum class Cardinality {
    Single,   ///< One value: `--name value`
    Multiple, ///< Ordered values: `--name a --name b`
    Flag,     ///< Present or absent: `--name`
    Counter   ///< Repeated occurrences: `-v -v -v`
};

/// Tag for presentation layers that offer native file/folder pickers.
enum class PathHint { None, File, Directory, Either };

/// Declared action of an argument, mapped onto a `Cardinality`.
enum class ArgAction {
    Set,      ///< Accumulate one value
    Append,   ///< Accumulate many values
    SetTrue,  ///< Boolean toggle, present means true
    SetFalse, ///< Boolean toggle, present means false
    Count     ///< Increment on repeat
};

[[nodiscard]] auto cardinality_for(ArgAction action) -> Cardinality;

[[nodiscard]] auto cardinality_name(Cardinality cardinality) -> const char*;

/// Static description of one argument.
struct ArgSpec {
    std::string id;
    std::string display_name;
    std::optional<std::string> invocation_token; ///< `--long` or `-s`; absent for positionals
    /// `-s` when the argument has a long name as well; accepted by the matcher
    /// but never emitted by the assembler.
    std::optional<std::string> short_token;
    std::optional<std::string> help_text;
    bool required = false;
    bool use_equals = false;
    Cardinality cardinality = Cardinality::Single;
    bool negated = false; ///< `ArgAction::SetFalse`: occurrence means false
    std::vector<std::string> default_values;
    std::vector<std::string> allowed_values;
    PathHint path_hint = PathHint::None;

    [[nodiscard]] auto is_positional() const -> bool {
        return !invocation_token.has_value();
    }

    /// True when `value` is acceptable for this argument's closed choice set.
    /// Arguments without `allowed_values` accept anything.
    [[nodiscard]] auto allows(std::string_view value) const -> bool;

    /// True when `token` is one of this argument's spellings.
    [[nodiscard]] auto accepts_token(std::string_view token) const -> bool {
        return (invocation_token && *invocation_token == token) ||
               (short_token && *short_token == token);
    }

    /// Whether this argument consumes a value after its token.
    [[nodiscard]] auto takes_value() const -> bool {
        return cardinality == Cardinality::Single || cardinality == Cardinality::Multiple;
    }
};

/// Static description of one command and its sub-command alternatives.
struct CommandSpec {
    std::string name;
    std::optional<std::string> about;
    std::vector<ArgSpec> args;            ///< Declaration order
    std::vector<CommandSpec> subcommands; ///< Declaration order
    bool subcommand_required = false;

    [[nodiscard]] auto find_arg(std::string_view id) const -> const ArgSpec*;
    [[nodiscard]] auto find_subcommand(std::string_view name) const -> const CommandSpec*;

    /// Looks up the argument spelled `token` (long or short form).
    [[nodiscard]] auto find_by_token(std::string_view token) const -> const ArgSpec*;

    [[nodiscard]] auto has_subcommands() const -> bool {
        return !subcommands.empty();
    }
};

// ============================================================================
// Builders
// ============================================================================

/// Declarative definition of one argument.
class ArgDef {
public:
    explicit ArgDef(std::string id) : id_(std::move(id)) {}

    /// Long spelling without dashes: `long_name("out")` yields `--out`.
    ArgDef& long_name(std::string name) {
        long_ = std::move(name);
        return *this;
    }
    ArgDef& short_name(char c) {
        short_ = c;
        return *this;
    }
    ArgDef& help(std::string text) {
        help_ = std::move(text);
        return *this;
    }
    /// Preferred over `help()` when both are set.
    ArgDef& long_help(std::string text) {
        long_help_ = std::move(text);
        return *this;
    }
    ArgDef& required(bool value = true) {
        required_ = value;
        return *this;
    }
    ArgDef& require_equals(bool value = true) {
        require_equals_ = value;
        return *this;
    }
    ArgDef& action(ArgAction action) {
        action_ = action;
        return *this;
    }
    ArgDef& default_value(std::string value) {
        defaults_.push_back(std::move(value));
        return *this;
    }
    ArgDef& possible_values(std::vector<std::string> values) {
        possible_ = std::move(values);
        return *this;
    }
    ArgDef& value_hint(PathHint hint) {
        hint_ = hint;
        return *this;
    }

private:
    friend class SpecBuilder;

    std::string id_;
    std::optional<std::string> long_;
    std::optional<char> short_;
    std::optional<std::string> help_;
    std::optional<std::string> long_help_;
    bool required_ = false;
    bool require_equals_ = false;
    ArgAction action_ = ArgAction::Set;
    std::vector<std::string> defaults_;
    std::vector<std::string> possible_;
    PathHint hint_ = PathHint::None;
};

/// Declarative definition of one command.
class CommandDef {
public:
    explicit CommandDef(std::string name) : name_(std::move(name)) {}

    CommandDef& about(std::string text) {
        about_ = std::move(text);
        return *this;
    }
    CommandDef& arg(ArgDef arg) {
        args_.push_back(std::move(arg));
        return *this;
    }
    CommandDef& subcommand(CommandDef sub) {
        subcommands_.push_back(std::move(sub));
        return *this;
    }
    CommandDef& subcommand_required(bool value = true) {
        subcommand_required_ = value;
        return *this;
    }

private:
    friend class SpecBuilder;

    std::string name_;
    std::optional<std::string> about_;
    std::vector<ArgDef> args_;
    std::vector<CommandDef> subcommands_;
    bool subcommand_required_ = false;
};

/// Schema defect found while building a `CommandSpec`.
struct SchemaError {
    enum class Kind {
        EmptyCommandName,
        EmptyArgId,
        DuplicateArgId,
        DuplicateToken,
        DuplicateSubcommand,
        TokenlessFlag ///< Flag or counter without `--long` / `-s`
    };

    Kind kind;
    std::string command; ///< Name of the command that holds the defect
    std::string subject; ///< Offending argument id, token or sub-command name

    [[nodiscard]] auto message() const -> std::string;
};

/// Walks a definition tree and produces the immutable schema.
class SpecBuilder {
public:
    [[nodiscard]] auto build(const CommandDef& def) -> Result<CommandSpec, SchemaError>;

private:
    [[nodiscard]] auto build_arg(const CommandDef& owner, const ArgDef& def)
        -> Result<ArgSpec, SchemaError>;
};

/// Convenience wrapper over `SpecBuilder::build`.
[[nodiscard]] auto build_spec(const CommandDef& def) -> Result<CommandSpec, SchemaError>;

} // namespace argrun::schema

#endif // ARGRUN_SCHEMA_COMMAND_SPEC_HPP
