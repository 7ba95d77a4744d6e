//! # Output Stream Model
//!
//! Interprets the captured output of a child as a list of segments for
//! display. Besides plain text a wrapped program can emit progress records,
//! one per line:
//!
//! ```text
//! ESC ] argrun;progress;<id>;<value>;<description> BEL
//! ```
//!
//! `value` is a fraction in [0, 1]. A later record with the same id updates
//! the bar in place. ANSI SGR sequences (colors) are removed from text.

#ifndef ARGRUN_OUTPUT_OUTPUT_PARSER_HPP
#define ARGRUN_OUTPUT_OUTPUT_PARSER_HPP

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace argrun::output {

struct TextSegment {
    std::string text;
};

struct ProgressSegment {
    std::string id;
    std::string description;
    float value;
};

using OutputSegment = std::variant<TextSegment, ProgressSegment>;

/// Record line for a progress bar, to be written to stdout by a wrapped
/// program. `value` is clamped to [0, 1]; ';' and control characters in the
/// id are replaced by '_'.
[[nodiscard]] std::string progress_bar(std::string_view id, std::string_view description,
                                       float value);

/// Removes ANSI CSI sequences ending in 'm' (colors and text attributes).
[[nodiscard]] std::string strip_ansi(std::string_view text);

/// Splits an output snapshot into segments. Adjacent text is merged;
/// malformed or unterminated records stay in the text verbatim.
[[nodiscard]] std::vector<OutputSegment> parse_output(std::string_view output);

} // namespace argrun::output

#endif // ARGRUN_OUTPUT_OUTPUT_PARSER_HPP
