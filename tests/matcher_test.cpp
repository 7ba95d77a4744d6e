//! # Argument Matcher Tests
//!
//! Parsing of argument vectors against a schema, including vectors produced
//! by the assembler.

#include "assemble/assembler.hpp"
#include "matcher/arg_matches.hpp"

#include <gtest/gtest.h>

using namespace argrun;
using namespace argrun::matcher;
using schema::ArgAction;
using schema::ArgDef;
using schema::CommandDef;

class MatcherTest : public ::testing::Test {
protected:
    schema::CommandSpec spec;

    void SetUp() override {
        CommandDef remote("remote");
        remote.arg(ArgDef("url").required()).arg(ArgDef("depth").long_name("depth"));

        CommandDef root("git");
        root.arg(ArgDef("dir").short_name('C'))
            .arg(ArgDef("config").long_name("config").require_equals().action(ArgAction::Append))
            .arg(ArgDef("bare").long_name("bare").action(ArgAction::SetTrue))
            .arg(ArgDef("verbose").short_name('v').action(ArgAction::Count))
            .arg(ArgDef("color").long_name("color").default_value("auto").possible_values(
                {"auto", "always", "never"}))
            .arg(ArgDef("path").required())
            .subcommand(std::move(remote))
            .subcommand(CommandDef("status"))
            .subcommand_required();
        auto result = schema::build_spec(root);
        ASSERT_TRUE(is_ok(result));
        spec = std::move(unwrap(result));
    }

    Result<ArgMatches, MatchError> match(const std::vector<std::string>& tokens) {
        return match_args(spec, tokens);
    }

    MatchError::Kind error_kind(const std::vector<std::string>& tokens) {
        auto result = match(tokens);
        EXPECT_TRUE(is_err(result));
        return unwrap_err(result).kind;
    }
};

// ============================================================================
// Accepted Syntax
// ============================================================================

TEST_F(MatcherTest, ValuesFlagsCountersAndSubcommand) {
    auto result = match({"-C", "/repo", "--config=a=1", "--config", "b=2", "--bare", "-vvv",
                         "src", "remote", "https://x", "--depth=1"});

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message();
    const auto& m = unwrap(result);
    EXPECT_EQ(m.command(), "git");
    EXPECT_EQ(m.get_one("dir"), "/repo");
    EXPECT_EQ(m.get_many("config"), (std::vector<std::string>{"a=1", "b=2"}));
    EXPECT_TRUE(m.get_flag("bare"));
    EXPECT_EQ(m.get_count("verbose"), 3u);
    EXPECT_EQ(m.get_one("path"), "src");
    EXPECT_EQ(m.subcommand_name(), "remote");

    const ArgMatches* sub = m.subcommand_matches();
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(sub->command(), "remote");
    EXPECT_EQ(sub->get_one("url"), "https://x");
    EXPECT_EQ(sub->get_one("depth"), "1");
}

TEST_F(MatcherTest, AttachedShortValue) {
    auto result = match({"-C/repo", "src", "status"});

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get_one("dir"), "/repo");
}

TEST_F(MatcherTest, DefaultsApplyWhenAbsent) {
    auto result = match({"src", "status"});

    ASSERT_TRUE(is_ok(result));
    const auto& m = unwrap(result);
    EXPECT_EQ(m.get_one("color"), "auto");
    EXPECT_EQ(m.value_source("color"), ValueSource::Default);
    EXPECT_EQ(m.value_source("path"), ValueSource::CommandLine);
    EXPECT_FALSE(m.contains("dir"));
    EXPECT_FALSE(m.get_flag("bare"));
    EXPECT_EQ(m.get_count("verbose"), 0u);
}

TEST_F(MatcherTest, SingleGivenTwiceKeepsLast) {
    auto result = match({"-C", "a", "-C", "b", "src", "status"});

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get_one("dir"), "b");
    EXPECT_EQ(unwrap(result).get_many("dir"), std::vector<std::string>{"b"});
}

TEST(MatcherSpellingTest, ShortNameOfLongArgAccepted) {
    CommandDef root("cc");
    root.arg(ArgDef("output").long_name("output").short_name('o'))
        .arg(ArgDef("quiet").long_name("quiet").short_name('q').action(ArgAction::SetTrue))
        .arg(ArgDef("verbose").long_name("verbose").short_name('v').action(ArgAction::Count));
    auto spec = schema::build_spec(root);
    ASSERT_TRUE(is_ok(spec));

    auto separate = match_args(unwrap(spec), {"-o", "x"});
    ASSERT_TRUE(is_ok(separate)) << unwrap_err(separate).message();
    EXPECT_EQ(unwrap(separate).get_one("output"), "x");

    auto attached = match_args(unwrap(spec), {"-oy"});
    ASSERT_TRUE(is_ok(attached));
    EXPECT_EQ(unwrap(attached).get_one("output"), "y");

    auto cluster = match_args(unwrap(spec), {"-qvvoz"});
    ASSERT_TRUE(is_ok(cluster)) << unwrap_err(cluster).message();
    EXPECT_TRUE(unwrap(cluster).get_flag("quiet"));
    EXPECT_EQ(unwrap(cluster).get_count("verbose"), 2u);
    EXPECT_EQ(unwrap(cluster).get_one("output"), "z");
}

TEST(MatcherSpellingTest, SetFalseFlagReadsInverted) {
    CommandDef root("ls");
    root.arg(ArgDef("no_color").long_name("no-color").action(ArgAction::SetFalse));
    auto spec = schema::build_spec(root);
    ASSERT_TRUE(is_ok(spec));

    auto absent = match_args(unwrap(spec), {});
    ASSERT_TRUE(is_ok(absent));
    EXPECT_TRUE(unwrap(absent).get_flag("no_color"));
    EXPECT_EQ(unwrap(absent).get_count("no_color"), 0u);

    auto given = match_args(unwrap(spec), {"--no-color"});
    ASSERT_TRUE(is_ok(given));
    EXPECT_FALSE(unwrap(given).get_flag("no_color"));
    EXPECT_EQ(unwrap(given).get_count("no_color"), 1u);
}

TEST(MatcherPositionalTest, DoubleDashEndsOptions) {
    CommandDef def("tool");
    def.arg(ArgDef("quiet").short_name('q').action(ArgAction::SetTrue))
        .arg(ArgDef("files").action(ArgAction::Append))
        .subcommand(CommandDef("sync"));
    auto spec = schema::build_spec(def);
    ASSERT_TRUE(is_ok(spec));

    auto result = match_args(unwrap(spec), {"-q", "a", "--", "-b", "sync"});

    ASSERT_TRUE(is_ok(result));
    const auto& m = unwrap(result);
    EXPECT_TRUE(m.get_flag("quiet"));
    // After "--" a sub-command name is just another word
    EXPECT_EQ(m.get_many("files"), (std::vector<std::string>{"a", "-b", "sync"}));
    EXPECT_FALSE(m.subcommand_name().has_value());
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(MatcherTest, UnknownArgument) {
    EXPECT_EQ(error_kind({"--nope", "src", "status"}), MatchError::Kind::UnknownArgument);
    EXPECT_EQ(error_kind({"-x", "src", "status"}), MatchError::Kind::UnknownArgument);
}

TEST_F(MatcherTest, MissingValueAtEnd) {
    auto result = match({"src", "status", "-C"});
    // "-C" belongs to the root, which "status" does not know
    ASSERT_TRUE(is_err(result));

    EXPECT_EQ(error_kind({"-C"}), MatchError::Kind::MissingValue);
}

TEST_F(MatcherTest, FlagWithInlineValue) {
    EXPECT_EQ(error_kind({"--bare=yes", "src", "status"}), MatchError::Kind::UnexpectedValue);
}

TEST_F(MatcherTest, ValueOutsideAllowedSet) {
    auto result = match({"--color", "purple", "src", "status"});

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, MatchError::Kind::InvalidValue);
    EXPECT_EQ(error.arg_id, "color");
    EXPECT_EQ(error.token, "purple");
    EXPECT_TRUE(error.path.empty());
}

TEST_F(MatcherTest, ExtraPositional) {
    EXPECT_EQ(error_kind({"src", "extra", "status"}), MatchError::Kind::UnexpectedPositional);
}

TEST_F(MatcherTest, MissingRequiredAndSubcommand) {
    EXPECT_EQ(error_kind({"status"}), MatchError::Kind::MissingRequired);
    EXPECT_EQ(error_kind({"src"}), MatchError::Kind::MissingSubcommand);

    auto result = match({"src", "remote"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).arg_id, "url");
    EXPECT_EQ(unwrap_err(result).path, state::CommandPath{"remote"});
}

// ============================================================================
// Assembled Vectors
// ============================================================================

TEST_F(MatcherTest, AssembledVectorParsesBack) {
    state::CommandState state(spec);
    ASSERT_TRUE(is_ok(state.add_multiple("config", "user.name=x")));
    ASSERT_TRUE(is_ok(state.set_counter("verbose", 2)));
    ASSERT_TRUE(is_ok(state.set_single("color", "never")));
    ASSERT_TRUE(is_ok(state.set_single("path", "src")));
    ASSERT_TRUE(is_ok(state.select_subcommand({}, "remote")));
    ASSERT_TRUE(is_ok(state.child()->set_single("url", "origin")));

    auto tokens = assemble::build_tokens(state);
    ASSERT_TRUE(is_ok(tokens));
    const auto& argv = unwrap(tokens);
    auto result = match(std::vector<std::string>(argv.begin() + 1, argv.end()));

    ASSERT_TRUE(is_ok(result));
    const auto& m = unwrap(result);
    EXPECT_EQ(m.get_many("config"), std::vector<std::string>{"user.name=x"});
    EXPECT_EQ(m.get_count("verbose"), 2u);
    EXPECT_EQ(m.get_one("color"), "never");
    ASSERT_NE(m.subcommand_matches(), nullptr);
    EXPECT_EQ(m.subcommand_matches()->get_one("url"), "origin");
}
