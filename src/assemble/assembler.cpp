//! # Argument Vector Assembler Implementation

#include "assemble/assembler.hpp"

#include "log/log.hpp"

#include <type_traits>

namespace argrun::assemble {

auto AssemblyError::message_id() const -> const char* {
    switch (kind) {
    case Kind::MissingRequired:
        return "required-field-missing";
    case Kind::MissingSubcommand:
        return "subcommand-missing";
    case Kind::InvalidValue:
        return "invalid-value";
    case Kind::Internal:
        return "internal-error";
    }
    return "internal-error";
}

namespace {

void push_value(Tokens& out, const schema::ArgSpec& spec, const std::string& value) {
    if (!spec.invocation_token) {
        out.push_back(value);
    } else if (spec.use_equals) {
        out.push_back(*spec.invocation_token + "=" + value);
    } else {
        out.push_back(*spec.invocation_token);
        out.push_back(value);
    }
}

auto append_node(const state::CommandState& node, state::CommandPath& path, Tokens& out)
    -> std::optional<AssemblyError> {
    out.push_back(node.spec().name);

    for (const auto& slot : node.slots()) {
        const schema::ArgSpec& spec = *slot.spec;

        auto error = std::visit(
            [&](const auto& v) -> std::optional<AssemblyError> {
                using T = std::decay_t<decltype(v)>;

                if constexpr (std::is_same_v<T, state::SingleValue>) {
                    if (!v.value.text.empty()) {
                        if (!spec.allows(v.value.text)) {
                            return AssemblyError{AssemblyError::Kind::InvalidValue, spec.id, path,
                                                 v.value.text};
                        }
                        push_value(out, spec, v.value.text);
                    } else if (spec.required) {
                        return AssemblyError{AssemblyError::Kind::MissingRequired, spec.id, path,
                                             std::nullopt};
                    }
                } else if constexpr (std::is_same_v<T, state::MultipleValue>) {
                    for (const auto& entry : v.values) {
                        if (!spec.allows(entry.text)) {
                            return AssemblyError{AssemblyError::Kind::InvalidValue, spec.id, path,
                                                 entry.text};
                        }
                        push_value(out, spec, entry.text);
                    }
                } else if constexpr (std::is_same_v<T, state::FlagValue>) {
                    if (v.set) {
                        if (!spec.invocation_token) {
                            return AssemblyError{AssemblyError::Kind::Internal, spec.id, path,
                                                 std::nullopt};
                        }
                        out.push_back(*spec.invocation_token);
                    }
                } else {
                    static_assert(std::is_same_v<T, state::CounterValue>);
                    if (v.count > 0 && !spec.invocation_token) {
                        return AssemblyError{AssemblyError::Kind::Internal, spec.id, path,
                                             std::nullopt};
                    }
                    for (uint32_t i = 0; i < v.count; ++i) {
                        out.push_back(*spec.invocation_token);
                    }
                }
                return std::nullopt;
            },
            slot.value.kind);

        if (error) {
            return error;
        }
    }

    if (const state::CommandState* child = node.child()) {
        path.push_back(child->spec().name);
        auto error = append_node(*child, path, out);
        if (error) {
            return error;
        }
        path.pop_back();
    } else if (node.spec().subcommand_required) {
        return AssemblyError{AssemblyError::Kind::MissingSubcommand, "", path, std::nullopt};
    }

    return std::nullopt;
}

} // namespace

auto build_tokens(const state::CommandState& root) -> Result<Tokens, AssemblyError> {
    Tokens tokens;
    state::CommandPath path;
    if (auto error = append_node(root, path, tokens)) {
        ARGRUN_LOG_DEBUG("assemble", "assembly failed: " << error->message_id() << " '"
                                                         << error->arg_id << "'");
        return *error;
    }
    ARGRUN_LOG_TRACE("assemble", "assembled " << tokens.size() << " tokens");
    return tokens;
}

} // namespace argrun::assemble
