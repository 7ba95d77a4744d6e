//! # Command State Tree Implementation

#include "state/command_state.hpp"

#include "log/log.hpp"
#include "state/identity.hpp"

#include <algorithm>
#include <type_traits>

namespace argrun::state {

// ============================================================================
// ArgValue
// ============================================================================

auto make_entry(std::string text) -> Entry {
    return Entry{std::move(text), new_identity()};
}

auto ArgValue::empty_for(const schema::ArgSpec& spec) -> ArgValue {
    ArgValue value;
    switch (spec.cardinality) {
    case schema::Cardinality::Single:
        value.kind = SingleValue{make_entry("")};
        break;
    case schema::Cardinality::Multiple:
        value.kind = MultipleValue{};
        break;
    case schema::Cardinality::Flag:
        value.kind = FlagValue{};
        break;
    case schema::Cardinality::Counter:
        value.kind = CounterValue{};
        break;
    }
    return value;
}

auto ArgValue::is_empty() const -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SingleValue>) {
                return v.value.text.empty();
            } else if constexpr (std::is_same_v<T, MultipleValue>) {
                return v.values.empty();
            } else if constexpr (std::is_same_v<T, FlagValue>) {
                return !v.set;
            } else {
                static_assert(std::is_same_v<T, CounterValue>);
                return v.count == 0;
            }
        },
        kind);
}

// ============================================================================
// StateError
// ============================================================================

auto StateError::message() const -> std::string {
    switch (kind) {
    case Kind::UnknownArg:
        return "unknown argument '" + subject + "'";
    case Kind::WrongCardinality:
        return "operation does not apply to argument '" + subject + "'";
    case Kind::IndexOutOfRange:
        return "value index out of range for argument '" + subject + "'";
    case Kind::UnknownSubcommand:
        return "unknown subcommand '" + subject + "'";
    case Kind::PathNotSelected:
        return "subcommand '" + subject + "' is not selected";
    }
    return "state error";
}

// ============================================================================
// Construction & lookup
// ============================================================================

CommandState::CommandState(const schema::CommandSpec& spec) : spec_(&spec) {
    slots_.reserve(spec.args.size());
    for (const auto& arg : spec.args) {
        slots_.push_back(ArgSlot{&arg, ArgValue::empty_for(arg)});
    }
}

auto CommandState::find_slot(std::string_view id) -> ArgSlot* {
    for (auto& slot : slots_) {
        if (slot.spec->id == id) {
            return &slot;
        }
    }
    return nullptr;
}

auto CommandState::value(std::string_view id) const -> const ArgValue* {
    for (const auto& slot : slots_) {
        if (slot.spec->id == id) {
            return &slot.value;
        }
    }
    return nullptr;
}

auto CommandState::node_at(const CommandPath& path) -> Result<CommandState*, StateError> {
    CommandState* node = this;
    for (const auto& name : path) {
        if (!node->chosen_ || *node->chosen_ != name || !node->child_) {
            return StateError{StateError::Kind::PathNotSelected, name};
        }
        node = node->child_.get();
    }
    return node;
}

auto CommandState::node_at(const CommandPath& path) const
    -> Result<const CommandState*, StateError> {
    const CommandState* node = this;
    for (const auto& name : path) {
        if (!node->chosen_ || *node->chosen_ != name || !node->child_) {
            return StateError{StateError::Kind::PathNotSelected, name};
        }
        node = node->child_.get();
    }
    return node;
}

// ============================================================================
// Mutations
// ============================================================================

template <typename T, typename F>
auto CommandState::mutate(std::string_view id, F&& fn) -> StateResult {
    ArgSlot* slot = find_slot(id);
    if (!slot) {
        return StateError{StateError::Kind::UnknownArg, std::string(id)};
    }
    auto* typed = std::get_if<T>(&slot->value.kind);
    if (!typed) {
        ARGRUN_LOG_DEBUG("state", "'" << id << "' is a "
                                      << schema::cardinality_name(slot->spec->cardinality)
                                      << " argument");
        return StateError{StateError::Kind::WrongCardinality, std::string(id)};
    }
    StateResult result = fn(*typed, *slot->spec);
    if (is_ok(result)) {
        slot->value.validation_error.reset();
    }
    return result;
}

auto CommandState::set_single(std::string_view id, std::string text) -> StateResult {
    return mutate<SingleValue>(id, [&](SingleValue& v, const schema::ArgSpec&) -> StateResult {
        v.value.text = std::move(text);
        return Unit{};
    });
}

auto CommandState::reset_single_to_default(std::string_view id) -> StateResult {
    return mutate<SingleValue>(id, [](SingleValue& v, const schema::ArgSpec& spec) -> StateResult {
        v.value.text = spec.default_values.empty() ? "" : spec.default_values.front();
        return Unit{};
    });
}

auto CommandState::add_multiple(std::string_view id, std::string text) -> StateResult {
    return mutate<MultipleValue>(id,
                                 [&](MultipleValue& v, const schema::ArgSpec&) -> StateResult {
                                     v.values.push_back(make_entry(std::move(text)));
                                     return Unit{};
                                 });
}

auto CommandState::set_multiple(std::string_view id, size_t index, std::string text)
    -> StateResult {
    return mutate<MultipleValue>(
        id, [&](MultipleValue& v, const schema::ArgSpec& spec) -> StateResult {
            if (index >= v.values.size()) {
                return StateError{StateError::Kind::IndexOutOfRange, spec.id};
            }
            v.values[index].text = std::move(text);
            return Unit{};
        });
}

auto CommandState::remove_multiple(std::string_view id, size_t index) -> StateResult {
    return mutate<MultipleValue>(
        id, [&](MultipleValue& v, const schema::ArgSpec& spec) -> StateResult {
            if (index >= v.values.size()) {
                return StateError{StateError::Kind::IndexOutOfRange, spec.id};
            }
            v.values.erase(v.values.begin() + static_cast<std::ptrdiff_t>(index));
            return Unit{};
        });
}

auto CommandState::reset_multiple_to_default(std::string_view id) -> StateResult {
    return mutate<MultipleValue>(id,
                                 [](MultipleValue& v, const schema::ArgSpec& spec) -> StateResult {
                                     v.values.clear();
                                     for (const auto& d : spec.default_values) {
                                         v.values.push_back(make_entry(d));
                                     }
                                     return Unit{};
                                 });
}

auto CommandState::toggle_flag(std::string_view id) -> StateResult {
    return mutate<FlagValue>(id, [](FlagValue& v, const schema::ArgSpec&) -> StateResult {
        v.set = !v.set;
        return Unit{};
    });
}

auto CommandState::set_flag(std::string_view id, bool set) -> StateResult {
    return mutate<FlagValue>(id, [set](FlagValue& v, const schema::ArgSpec&) -> StateResult {
        v.set = set;
        return Unit{};
    });
}

auto CommandState::increment_counter(std::string_view id) -> StateResult {
    return mutate<CounterValue>(id, [](CounterValue& v, const schema::ArgSpec&) -> StateResult {
        if (v.count < CounterValue::MAX) {
            ++v.count;
        }
        return Unit{};
    });
}

auto CommandState::decrement_counter(std::string_view id) -> StateResult {
    return mutate<CounterValue>(id, [](CounterValue& v, const schema::ArgSpec&) -> StateResult {
        if (v.count > 0) {
            --v.count;
        }
        return Unit{};
    });
}

auto CommandState::set_counter(std::string_view id, uint32_t count) -> StateResult {
    return mutate<CounterValue>(id,
                                [count](CounterValue& v, const schema::ArgSpec&) -> StateResult {
                                    v.count = std::min(count, CounterValue::MAX);
                                    return Unit{};
                                });
}

auto CommandState::select_subcommand(const CommandPath& path, std::string_view chosen)
    -> StateResult {
    auto target = node_at(path);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    CommandState* node = unwrap(target);

    const schema::CommandSpec* sub = node->spec_->find_subcommand(chosen);
    if (!sub) {
        return StateError{StateError::Kind::UnknownSubcommand, std::string(chosen)};
    }

    node->child_ = make_box<CommandState>(*sub);
    node->chosen_ = sub->name;
    ARGRUN_LOG_DEBUG("state", "selected subcommand '" << sub->name << "' under '"
                                                      << node->spec_->name << "'");
    return Unit{};
}

auto CommandState::clear_subcommand(const CommandPath& path) -> StateResult {
    auto target = node_at(path);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    CommandState* node = unwrap(target);
    node->child_.reset();
    node->chosen_.reset();
    return Unit{};
}

// ============================================================================
// Validation errors
// ============================================================================

void CommandState::apply_validation_error(std::string_view id, std::string message) {
    for (CommandState* node = this; node; node = node->child_.get()) {
        if (ArgSlot* slot = node->find_slot(id)) {
            slot->value.validation_error = std::move(message);
            return;
        }
    }
    ARGRUN_LOG_DEBUG("state", "dropping validation error for unknown argument '" << id << "'");
}

void CommandState::clear_validation_errors() {
    for (CommandState* node = this; node; node = node->child_.get()) {
        for (auto& slot : node->slots_) {
            slot.value.validation_error.reset();
        }
    }
}

} // namespace argrun::state
