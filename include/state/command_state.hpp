//! # Command State Tree
//!
//! Mutable mirror of a `schema::CommandSpec`. Each node owns one `ArgValue`
//! per declared argument (in declaration order) and, for commands with
//! sub-commands, at most one selected child node.
//!
//! ## Lifecycle
//!
//! The tree is built once from the schema and mutated in place for the rest
//! of the host's lifetime. Only values and sub-command choices change; the
//! set of argument slots of every node always matches its spec.
//!
//! Selecting a sub-command always builds a fresh child node. Edits made in a
//! previously selected branch are discarded when the user switches away.
//!
//! ## Ownership
//!
//! Nodes reference their `CommandSpec` by pointer. The `CommandSpec` tree must outlive
//! every state tree built from it.

#ifndef ARGRUN_STATE_COMMAND_STATE_HPP
#define ARGRUN_STATE_COMMAND_STATE_HPP

#include "common.hpp"
#include "schema/command_spec.hpp"
#include "state/arg_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argrun::state {

/// Path from a node down to a descendant: the chosen sub-command names.
using CommandPath = std::vector<std::string>;

/// A mutation addressed something the node does not have.
struct StateError {
    enum class Kind {
        UnknownArg,        ///< No argument with that id in this node
        WrongCardinality,  ///< Operation does not apply to the argument's kind
        IndexOutOfRange,   ///< Multiple-value index past the end
        UnknownSubcommand, ///< No such sub-command alternative
        PathNotSelected    ///< A path element is not the currently selected branch
    };

    Kind kind;
    std::string subject;

    [[nodiscard]] auto message() const -> std::string;
};

using StateResult = Result<Unit, StateError>;

/// One argument of a node: its static spec and its current value.
struct ArgSlot {
    const schema::ArgSpec* spec;
    ArgValue value;
};

class CommandState {
public:
    explicit CommandState(const schema::CommandSpec& spec);

    CommandState(CommandState&&) noexcept = default;
    CommandState& operator=(CommandState&&) noexcept = default;
    CommandState(const CommandState&) = delete;
    CommandState& operator=(const CommandState&) = delete;

    // ------------------------------------------------------------------------
    // Read access
    // ------------------------------------------------------------------------

    [[nodiscard]] auto spec() const -> const schema::CommandSpec& {
        return *spec_;
    }

    /// Argument slots in declaration order.
    [[nodiscard]] auto slots() const -> const std::vector<ArgSlot>& {
        return slots_;
    }

    [[nodiscard]] auto value(std::string_view id) const -> const ArgValue*;

    /// Name of the selected sub-command, if any.
    [[nodiscard]] auto chosen_subcommand() const -> const std::optional<std::string>& {
        return chosen_;
    }

    /// The selected child node, or nullptr.
    [[nodiscard]] auto child() const -> const CommandState* {
        return child_.get();
    }
    [[nodiscard]] auto child() -> CommandState* {
        return child_.get();
    }

    /// Walks `path` through the selected branches.
    [[nodiscard]] auto node_at(const CommandPath& path) -> Result<CommandState*, StateError>;
    [[nodiscard]] auto node_at(const CommandPath& path) const
        -> Result<const CommandState*, StateError>;

    // ------------------------------------------------------------------------
    // Mutations (every successful mutation clears that value's validation error)
    // ------------------------------------------------------------------------

    auto set_single(std::string_view id, std::string text) -> StateResult;
    auto reset_single_to_default(std::string_view id) -> StateResult;

    auto add_multiple(std::string_view id, std::string text) -> StateResult;
    auto set_multiple(std::string_view id, size_t index, std::string text) -> StateResult;
    auto remove_multiple(std::string_view id, size_t index) -> StateResult;
    /// Replaces all entries with the argument's defaults (empty when none).
    auto reset_multiple_to_default(std::string_view id) -> StateResult;

    auto toggle_flag(std::string_view id) -> StateResult;
    auto set_flag(std::string_view id, bool set) -> StateResult;

    /// Saturates at `CounterValue::MAX`.
    auto increment_counter(std::string_view id) -> StateResult;
    /// Floored at 0; decrementing 0 is a no-op.
    auto decrement_counter(std::string_view id) -> StateResult;
    auto set_counter(std::string_view id, uint32_t count) -> StateResult;

    /// Replaces the choice at `path` with a freshly built child for `chosen`.
    auto select_subcommand(const CommandPath& path, std::string_view chosen) -> StateResult;

    /// Unsets the choice at `path`.
    auto clear_subcommand(const CommandPath& path) -> StateResult;

    // ------------------------------------------------------------------------
    // Validation errors
    // ------------------------------------------------------------------------

    /// Paints `message` on the first value whose id matches, searching this
    /// node and then the selected branch. An unknown id is dropped.
    void apply_validation_error(std::string_view id, std::string message);

    /// Clears every validation error in this node and the selected branch.
    void clear_validation_errors();

private:
    [[nodiscard]] auto find_slot(std::string_view id) -> ArgSlot*;

    template <typename T, typename F> auto mutate(std::string_view id, F&& fn) -> StateResult;

    const schema::CommandSpec* spec_;
    std::vector<ArgSlot> slots_;
    std::optional<std::string> chosen_;
    Box<CommandState> child_;
};

} // namespace argrun::state

#endif // ARGRUN_STATE_COMMAND_STATE_HPP
