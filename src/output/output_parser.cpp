#include "output/output_parser.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>

namespace argrun::output {

namespace {

constexpr std::string_view RECORD_PREFIX = "\x1b]argrun;progress;";
constexpr char RECORD_END = '\x07';

bool is_control(char c) {
    return static_cast<unsigned char>(c) < 0x20 || c == 0x7F;
}

/// Parses the body of a record ("<id>;<value>;<description>").
std::optional<ProgressSegment> parse_record(std::string_view body) {
    size_t first = body.find(';');
    if (first == std::string_view::npos || first == 0) {
        return std::nullopt;
    }
    size_t second = body.find(';', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    std::string value_text(body.substr(first + 1, second - first - 1));
    if (value_text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    float value = std::strtof(value_text.c_str(), &end);
    if (end != value_text.c_str() + value_text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }

    return ProgressSegment{std::string(body.substr(0, first)),
                           std::string(body.substr(second + 1)), std::clamp(value, 0.0f, 1.0f)};
}

void push_text(std::vector<OutputSegment>& segments, std::string_view raw) {
    if (raw.empty()) {
        return;
    }
    std::string text = strip_ansi(raw);
    if (!segments.empty()) {
        if (auto* last = std::get_if<TextSegment>(&segments.back())) {
            last->text += text;
            return;
        }
    }
    segments.push_back(TextSegment{std::move(text)});
}

void push_progress(std::vector<OutputSegment>& segments, ProgressSegment bar) {
    for (auto& segment : segments) {
        if (auto* existing = std::get_if<ProgressSegment>(&segment)) {
            if (existing->id == bar.id) {
                *existing = std::move(bar);
                return;
            }
        }
    }
    segments.push_back(std::move(bar));
}

} // namespace

std::string progress_bar(std::string_view id, std::string_view description, float value) {
    std::string safe_id(id);
    for (char& c : safe_id) {
        if (c == ';' || is_control(c)) {
            c = '_';
        }
    }
    std::string safe_description(description);
    for (char& c : safe_description) {
        if (is_control(c)) {
            c = ' ';
        }
    }

    double fraction = std::isfinite(value) ? std::clamp(value, 0.0f, 1.0f) : 0.0;
    char number[32];
    std::snprintf(number, sizeof(number), "%.4f", fraction);

    std::string line(RECORD_PREFIX);
    line += safe_id;
    line += ';';
    line += number;
    line += ';';
    line += safe_description;
    line += RECORD_END;
    line += '\n';
    return line;
}

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\x1b' || i + 1 >= text.size() || text[i + 1] != '[') {
            out.push_back(text[i++]);
            continue;
        }
        // CSI: parameter bytes, intermediate bytes, one final byte
        size_t j = i + 2;
        while (j < text.size() && text[j] >= 0x30 && text[j] <= 0x3F) {
            ++j;
        }
        while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x2F) {
            ++j;
        }
        if (j < text.size() && text[j] == 'm') {
            i = j + 1;
        } else {
            out.push_back(text[i++]);
        }
    }
    return out;
}

std::vector<OutputSegment> parse_output(std::string_view output) {
    std::vector<OutputSegment> segments;
    size_t pos = 0;
    while (pos < output.size()) {
        size_t start = output.find(RECORD_PREFIX, pos);
        if (start == std::string_view::npos) {
            push_text(segments, output.substr(pos));
            break;
        }
        push_text(segments, output.substr(pos, start - pos));

        size_t body_start = start + RECORD_PREFIX.size();
        size_t end = output.find(RECORD_END, body_start);
        if (end == std::string_view::npos) {
            // Unterminated, possibly still being written
            push_text(segments, output.substr(start));
            break;
        }

        auto bar = parse_record(output.substr(body_start, end - body_start));
        size_t next = end + 1;
        if (next < output.size() && output[next] == '\n') {
            ++next;
        }
        if (bar) {
            push_progress(segments, std::move(*bar));
        } else {
            ARGRUN_LOG_DEBUG("output", "malformed progress record at offset " << start);
            push_text(segments, output.substr(start, next - start));
        }
        pos = next;
    }
    return segments;
}

} // namespace argrun::output
