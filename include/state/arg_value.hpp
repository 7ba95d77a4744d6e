//! # Argument Values
//!
//! Mutable runtime value of one argument. The value is a closed variant with
//! one alternative per `schema::Cardinality`; every consumer visits it
//! exhaustively.
//!
//! | Alternative     | Cardinality | Empty state     |
//! |-----------------|-------------|-----------------|
//! | `SingleValue`   | Single      | `""`            |
//! | `MultipleValue` | Multiple    | `[]`            |
//! | `FlagValue`     | Flag        | `false`         |
//! | `CounterValue`  | Counter     | `0`             |

#ifndef ARGRUN_STATE_ARG_VALUE_HPP
#define ARGRUN_STATE_ARG_VALUE_HPP

#include "schema/command_spec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace argrun::state {

/// One user-editable text value plus its presentation identity.
struct Entry {
    std::string text;
    std::string identity;
};

/// Creates an entry with a fresh identity.
[[nodiscard]] auto make_entry(std::string text) -> Entry;

struct SingleValue {
    Entry value;
};

struct MultipleValue {
    std::vector<Entry> values;
};

struct FlagValue {
    bool set = false;
};

struct CounterValue {
    static constexpr uint32_t MAX = 255;
    uint32_t count = 0;
};

/// Runtime value of one argument plus its transient validation error.
struct ArgValue {
    std::variant<SingleValue, MultipleValue, FlagValue, CounterValue> kind;
    std::optional<std::string> validation_error;

    /// The empty value matching `spec.cardinality`.
    [[nodiscard]] static auto empty_for(const schema::ArgSpec& spec) -> ArgValue;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets the value as alternative `T`. Throws if it holds another one.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// True when the value is in its empty state.
    [[nodiscard]] auto is_empty() const -> bool;
};

} // namespace argrun::state

#endif // ARGRUN_STATE_ARG_VALUE_HPP
