//! # Display Names
//!
//! Human labels derived from argument ids.

#ifndef ARGRUN_SCHEMA_DISPLAY_NAME_HPP
#define ARGRUN_SCHEMA_DISPLAY_NAME_HPP

#include <string>
#include <string_view>

namespace argrun::schema {

/// Converts an identifier to sentence case.
///
/// Words are split on non-alphanumeric characters and on lower-to-upper
/// camel-case boundaries. The first word is capitalized and every other
/// letter is lower-cased. A digit ends the current word without inserting
/// a space before it.
///
/// `count_occurrences` -> `Count occurrences`, `nativePathPicker` ->
/// `Native path picker`, `--log-file` -> `Log file`.
[[nodiscard]] std::string to_sentence_case(std::string_view id);

} // namespace argrun::schema

#endif // ARGRUN_SCHEMA_DISPLAY_NAME_HPP
