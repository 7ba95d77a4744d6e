#include "app/settings.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace argrun::app {

// ============================================================================
// Localization
// ============================================================================

Localization::Localization()
    : messages_{
          // Notices
          {"required-field-missing", "Required field missing"},
          {"subcommand-missing", "A subcommand is required"},
          {"invalid-value", "Invalid value"},
          {"env-key-empty", "Environment variable can't be empty"},
          {"internal-error", "Internal error"},
          {"spawn-failed", "Could not start the program"},
          // Widget labels
          {"optional", "(Optional)"},
          {"select-file", "Select file..."},
          {"select-directory", "Select directory..."},
          {"new-value", "New value"},
          {"reset", "Reset"},
          {"reset-to-default", "Reset to default"},
          {"arguments", "Arguments"},
          {"env-variables", "Environment variables"},
          {"input", "Input"},
          {"text", "Text"},
          {"file", "File"},
          {"working-directory", "Working directory"},
          {"run", "Run"},
          {"kill", "Kill"},
          {"running", "Running"},
      } {}

auto Localization::get(std::string_view id) const -> std::string {
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::string(id);
    }
    return it->second;
}

auto Localization::set(std::string_view id, std::string text) -> bool {
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return false;
    }
    it->second = std::move(text);
    return true;
}

auto Localization::knows(std::string_view id) const -> bool {
    return messages_.find(id) != messages_.end();
}

auto Localization::required_message(std::string_view display_name) const -> std::string {
    std::string out = required_prefix;
    out += display_name;
    out += required_suffix;
    return out;
}

auto ConfigError::to_string() const -> std::string {
    if (line <= 0) {
        return message;
    }
    return "line " + std::to_string(line) + ": " + message;
}

// ============================================================================
// Settings parser
// ============================================================================

namespace {

/// Line-oriented TOML subset: [section] headers, key = "string" pairs and
/// # comments.
class SettingsParser {
public:
    explicit SettingsParser(std::string_view content) : content_(content) {}

    Result<Settings, ConfigError> parse() {
        Settings settings;
        while (!is_eof()) {
            skip_whitespace();
            char c = peek();
            if (is_eof()) {
                break;
            }
            if (c == '\n' || c == '\r') {
                advance();
            } else if (c == '#') {
                skip_comment();
            } else if (c == '[') {
                if (!parse_section_header()) {
                    return *error_;
                }
            } else if (!parse_pair(settings)) {
                return *error_;
            }
        }
        return settings;
    }

private:
    std::string_view content_;
    size_t pos_ = 0;
    int line_ = 1;
    std::string section_;
    std::optional<ConfigError> error_;

    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance() {
        char c = content_[pos_++];
        if (c == '\n') {
            ++line_;
        }
        return c;
    }

    void skip_whitespace() {
        while (peek() == ' ' || peek() == '\t') {
            advance();
        }
    }

    void skip_comment() {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }

    bool set_error(const std::string& message) {
        error_ = ConfigError{line_, message};
        return false;
    }

    std::string parse_identifier() {
        std::string id;
        while (!is_eof()) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
                id.push_back(advance());
            } else {
                break;
            }
        }
        return id;
    }

    std::optional<std::string> parse_string() {
        if (peek() != '"') {
            set_error("expected a quoted string");
            return std::nullopt;
        }
        advance();
        std::string value;
        while (true) {
            if (is_eof() || peek() == '\n') {
                set_error("unterminated string");
                return std::nullopt;
            }
            char c = advance();
            if (c == '"') {
                return value;
            }
            if (c != '\\') {
                value.push_back(c);
                continue;
            }
            char escaped = is_eof() ? '\0' : advance();
            switch (escaped) {
            case '"':
                value.push_back('"');
                break;
            case '\\':
                value.push_back('\\');
                break;
            case 'n':
                value.push_back('\n');
                break;
            case 't':
                value.push_back('\t');
                break;
            default:
                set_error(std::string("unsupported escape '\\") + escaped + "'");
                return std::nullopt;
            }
        }
    }

    // Only whitespace or a comment may follow on the same line
    bool expect_line_end() {
        skip_whitespace();
        if (peek() == '#') {
            skip_comment();
        }
        if (peek() == '\r') {
            advance();
        }
        if (is_eof()) {
            return true;
        }
        if (peek() != '\n') {
            return set_error("unexpected characters after value");
        }
        advance();
        return true;
    }

    bool parse_section_header() {
        advance(); // [
        skip_whitespace();
        std::string name = parse_identifier();
        skip_whitespace();
        if (peek() != ']') {
            return set_error("expected ']' after section name");
        }
        advance();
        if (name != "settings" && name != "localization") {
            return set_error("unknown section [" + name + "]");
        }
        section_ = name;
        return expect_line_end();
    }

    bool parse_pair(Settings& settings) {
        int key_line = line_;
        std::string key = parse_identifier();
        if (key.empty()) {
            return set_error("expected a key");
        }
        skip_whitespace();
        if (peek() != '=') {
            return set_error("expected '=' after '" + key + "'");
        }
        advance();
        skip_whitespace();
        auto value = parse_string();
        if (!value) {
            return false;
        }
        if (!expect_line_end()) {
            return false;
        }

        if (!apply(settings, key, std::move(*value))) {
            error_->line = key_line;
            return false;
        }
        ARGRUN_LOG_TRACE("settings", "[" << section_ << "] " << key << " set");
        return true;
    }

    bool apply(Settings& settings, const std::string& key, std::string value) {
        if (section_.empty()) {
            return set_error("key '" + key + "' outside of a section");
        }

        if (section_ == "settings") {
            if (key == "enable_env") {
                settings.enable_env = std::move(value);
            } else if (key == "enable_stdin") {
                settings.enable_stdin = std::move(value);
            } else if (key == "enable_working_dir") {
                settings.enable_working_dir = std::move(value);
            } else if (key == "mode") {
                if (value == "self-reentry") {
                    settings.mode = ExecMode::SelfReentry;
                } else if (value == "external") {
                    settings.mode = ExecMode::External;
                } else {
                    return set_error("mode must be \"self-reentry\" or \"external\"");
                }
            } else {
                return set_error("unknown setting '" + key + "'");
            }
            return true;
        }

        Localization& loc = settings.localization;
        if (key == "required-prefix") {
            loc.required_prefix = std::move(value);
        } else if (key == "required-suffix") {
            loc.required_suffix = std::move(value);
        } else if (!loc.set(key, std::move(value))) {
            return set_error("unknown message id '" + key + "'");
        }
        return true;
    }
};

} // namespace

auto parse_settings(std::string_view text) -> Result<Settings, ConfigError> {
    SettingsParser parser(text);
    auto result = parser.parse();
    if (is_err(result)) {
        ARGRUN_LOG_WARN("settings", unwrap_err(result).to_string());
    }
    return result;
}

auto load_settings(const std::filesystem::path& path) -> Result<Settings, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{0, "cannot open settings file '" + path.string() + "'"};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    ARGRUN_LOG_DEBUG("settings", "loading " << path.string());
    return parse_settings(buffer.str());
}

} // namespace argrun::app
