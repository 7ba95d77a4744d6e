//! # Argument Vector Assembler
//!
//! Serializes a `state::CommandState` tree into the ordered token list that
//! is handed to process spawning.
//!
//! ## Token Rules
//!
//! | Kind     | Value           | Tokens                                   |
//! |----------|-----------------|------------------------------------------|
//! | Single   | `x`             | `--t=x` (use_equals), `--t x`, or `x`    |
//! | Single   | empty, optional | nothing                                  |
//! | Single   | empty, required | `MissingRequired(id)`                    |
//! | Single   | not allowed     | `InvalidValue(id, value)`                |
//! | Multiple | `[a, b]`        | the Single rule for each entry, in order |
//! | Flag     | true            | `--t`                                    |
//! | Counter  | 3               | `-t -t -t`                               |
//!
//! Every node contributes its own name first (the program name at the root,
//! the sub-command name below it), then its arguments in declaration order,
//! then the selected child node.
//!
//! Assembly is deterministic. On failure it writes the error message into the
//! offending value's `validation_error` and touches nothing else.

#ifndef ARGRUN_ASSEMBLE_ASSEMBLER_HPP
#define ARGRUN_ASSEMBLE_ASSEMBLER_HPP

#include "common.hpp"
#include "state/command_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace argrun::assemble {

/// Why a run attempt could not produce an argument vector.
struct AssemblyError {
    enum class Kind {
        MissingRequired,   ///< Required single value left empty
        MissingSubcommand, ///< Command requires a sub-command, none selected
        InvalidValue,      ///< Value outside the argument's allowed set
        Internal           ///< Schema defect: flag or counter without a token
    };

    Kind kind;
    std::string arg_id;           ///< Empty for MissingSubcommand
    state::CommandPath path;      ///< Node holding the offending argument
    std::optional<std::string> value;

    /// Stable message identifier for localized lookup.
    [[nodiscard]] auto message_id() const -> const char*;

    /// True for user-fixable errors, false for schema defects.
    [[nodiscard]] auto is_validation() const -> bool {
        return kind != Kind::Internal;
    }
};

using Tokens = std::vector<std::string>;

/// Pure token construction; never writes to the tree.
[[nodiscard]] auto build_tokens(const state::CommandState& root) -> Result<Tokens, AssemblyError>;

/// Builds the tokens and, on a validation failure, paints `message` produced
/// by `describe(error)` onto the offending value.
template <typename Describe>
[[nodiscard]] auto assemble(state::CommandState& root, Describe&& describe)
    -> Result<Tokens, AssemblyError> {
    auto result = build_tokens(root);
    if (is_err(result)) {
        const AssemblyError& error = unwrap_err(result);
        if (!error.arg_id.empty()) {
            auto node = root.node_at(error.path);
            if (is_ok(node)) {
                unwrap(node)->apply_validation_error(error.arg_id, describe(error));
            }
        }
    }
    return result;
}

} // namespace argrun::assemble

#endif // ARGRUN_ASSEMBLE_ASSEMBLER_HPP
