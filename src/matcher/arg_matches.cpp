//! # Argument Matcher Implementation

#include "matcher/arg_matches.hpp"

#include "log/log.hpp"

namespace argrun::matcher {

// ============================================================================
// ArgMatches accessors
// ============================================================================

auto ArgMatches::contains(std::string_view id) const -> bool {
    return sources_.find(id) != sources_.end();
}

auto ArgMatches::get_one(std::string_view id) const -> std::optional<std::string> {
    auto it = values_.find(id);
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

auto ArgMatches::get_many(std::string_view id) const -> std::vector<std::string> {
    auto it = values_.find(id);
    if (it == values_.end()) {
        return {};
    }
    return it->second;
}

auto ArgMatches::get_flag(std::string_view id) const -> bool {
    bool present = get_count(id) > 0;
    return negated_.find(id) != negated_.end() ? !present : present;
}

auto ArgMatches::get_count(std::string_view id) const -> uint32_t {
    auto it = occurrences_.find(id);
    return it == occurrences_.end() ? 0 : it->second;
}

auto ArgMatches::value_source(std::string_view id) const -> std::optional<ValueSource> {
    auto it = sources_.find(id);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// MatchError
// ============================================================================

auto MatchError::message() const -> std::string {
    switch (kind) {
    case Kind::UnknownArgument:
        return "unexpected argument '" + token + "'";
    case Kind::MissingValue:
        return "a value is required for '" + arg_id + "' but none was supplied";
    case Kind::UnexpectedValue:
        return "'" + arg_id + "' does not take a value";
    case Kind::InvalidValue:
        return "invalid value '" + token + "' for '" + arg_id + "'";
    case Kind::UnexpectedPositional:
        return "unexpected positional argument '" + token + "'";
    case Kind::MissingRequired:
        return "the argument '" + arg_id + "' is required";
    case Kind::MissingSubcommand:
        return "a subcommand is required";
    }
    return "match error";
}

// ============================================================================
// Matcher
// ============================================================================

auto Matcher::record_value(const schema::ArgSpec& arg, std::string value, ArgMatches& out)
    -> std::optional<MatchError> {
    if (!arg.allows(value)) {
        return error(MatchError::Kind::InvalidValue, arg.id, std::move(value));
    }
    auto& values = out.values_[arg.id];
    if (arg.cardinality == schema::Cardinality::Single) {
        values.clear();
    }
    values.push_back(std::move(value));
    ++out.occurrences_[arg.id];
    out.sources_[arg.id] = ValueSource::CommandLine;
    return std::nullopt;
}

auto Matcher::take_next_value(const schema::ArgSpec& arg) -> std::optional<std::string> {
    if (pos_ >= tokens_.size()) {
        return std::nullopt;
    }
    ARGRUN_LOG_TRACE("match", "'" << arg.id << "' takes value '" << tokens_[pos_] << "'");
    return tokens_[pos_++];
}

auto Matcher::parse_long(const schema::CommandSpec& spec, std::string_view token,
                         ArgMatches& out) -> std::optional<MatchError> {
    std::string_view name = token;
    std::optional<std::string> inline_value;
    if (auto eq = token.find('='); eq != std::string_view::npos) {
        name = token.substr(0, eq);
        inline_value = std::string(token.substr(eq + 1));
    }

    const schema::ArgSpec* arg = spec.find_by_token(name);
    if (!arg) {
        return error(MatchError::Kind::UnknownArgument, "", std::string(token));
    }

    if (!arg->takes_value()) {
        if (inline_value) {
            return error(MatchError::Kind::UnexpectedValue, arg->id, std::string(token));
        }
        ++out.occurrences_[arg->id];
        out.sources_[arg->id] = ValueSource::CommandLine;
        return std::nullopt;
    }

    if (!inline_value) {
        inline_value = take_next_value(*arg);
        if (!inline_value) {
            return error(MatchError::Kind::MissingValue, arg->id, std::string(token));
        }
    }
    return record_value(*arg, std::move(*inline_value), out);
}

auto Matcher::parse_short_cluster(const schema::CommandSpec& spec, std::string_view token,
                                  ArgMatches& out) -> std::optional<MatchError> {
    // token is "-abc"; each character is a short name until one takes a value
    for (size_t i = 1; i < token.size(); ++i) {
        std::string short_token = std::string("-") + token[i];
        const schema::ArgSpec* arg = spec.find_by_token(short_token);
        if (!arg) {
            return error(MatchError::Kind::UnknownArgument, "", std::string(token));
        }

        if (!arg->takes_value()) {
            ++out.occurrences_[arg->id];
            out.sources_[arg->id] = ValueSource::CommandLine;
            continue;
        }

        std::string_view rest = token.substr(i + 1);
        if (!rest.empty() && rest.front() == '=') {
            rest.remove_prefix(1);
        }
        std::optional<std::string> value;
        if (!rest.empty()) {
            value = std::string(rest);
        } else {
            value = take_next_value(*arg);
        }
        if (!value) {
            return error(MatchError::Kind::MissingValue, arg->id, std::string(token));
        }
        return record_value(*arg, std::move(*value), out);
    }
    return std::nullopt;
}

auto Matcher::finish(const schema::CommandSpec& spec, ArgMatches& out)
    -> std::optional<MatchError> {
    for (const auto& arg : spec.args) {
        if (arg.negated) {
            out.negated_.insert(arg.id);
        }
        if (out.contains(arg.id)) {
            continue;
        }
        if (arg.takes_value() && !arg.default_values.empty()) {
            auto& values = out.values_[arg.id];
            if (arg.cardinality == schema::Cardinality::Single) {
                values.push_back(arg.default_values.front());
            } else {
                values = arg.default_values;
            }
            out.sources_[arg.id] = ValueSource::Default;
            continue;
        }
        if (arg.required && arg.cardinality == schema::Cardinality::Single) {
            return error(MatchError::Kind::MissingRequired, arg.id, "");
        }
    }

    if (spec.subcommand_required && !out.subcommand_name_) {
        return error(MatchError::Kind::MissingSubcommand, "", "");
    }
    return std::nullopt;
}

auto Matcher::parse_command(const schema::CommandSpec& spec, ArgMatches& out)
    -> std::optional<MatchError> {
    std::vector<const schema::ArgSpec*> positionals;
    for (const auto& arg : spec.args) {
        if (arg.is_positional()) {
            positionals.push_back(&arg);
        }
    }
    size_t next_positional = 0;

    while (pos_ < tokens_.size()) {
        const std::string& token = tokens_[pos_++];

        if (!options_done_) {
            if (token == "--") {
                options_done_ = true;
                continue;
            }
            if (token.size() > 2 && token.starts_with("--")) {
                if (auto err = parse_long(spec, token, out)) {
                    return err;
                }
                continue;
            }
            if (token.size() > 1 && token[0] == '-' && token[1] != '-') {
                if (auto err = parse_short_cluster(spec, token, out)) {
                    return err;
                }
                continue;
            }

            if (const schema::CommandSpec* sub = spec.find_subcommand(token)) {
                out.subcommand_name_ = sub->name;
                out.subcommand_ = make_box<ArgMatches>(sub->name);
                path_.push_back(sub->name);
                if (auto err = parse_command(*sub, *out.subcommand_)) {
                    return err;
                }
                path_.pop_back();
                break;
            }
        }

        if (next_positional >= positionals.size()) {
            return error(MatchError::Kind::UnexpectedPositional, "", token);
        }
        const schema::ArgSpec* arg = positionals[next_positional];
        if (auto err = record_value(*arg, token, out)) {
            return err;
        }
        // A multiple-value positional keeps collecting the remaining words
        if (arg->cardinality != schema::Cardinality::Multiple) {
            ++next_positional;
        }
    }

    return finish(spec, out);
}

auto Matcher::parse() -> Result<ArgMatches, MatchError> {
    ArgMatches matches(root_.name);
    pos_ = 0;
    options_done_ = false;
    path_.clear();

    if (auto err = parse_command(root_, matches)) {
        ARGRUN_LOG_DEBUG("match", "argv rejected: " << err->message());
        return *err;
    }
    return std::move(matches);
}

auto match_args(const schema::CommandSpec& spec, const std::vector<std::string>& tokens)
    -> Result<ArgMatches, MatchError> {
    Matcher matcher(spec, tokens);
    return matcher.parse();
}

} // namespace argrun::matcher
