#include "execkit/command.hpp"

#include <gtest/gtest.h>

#include <format>
#include <string>
#include <vector>

using execkit::Command;
using Args = std::vector<std::string>;

TEST(Split, SingleQuotesKeepSpaces) {
    auto words = execkit::split("echo 'a b' c");
    ASSERT_TRUE(words.has_value()) << words.error();
    EXPECT_EQ(*words, (Args{"echo", "a b", "c"}));
}

TEST(Split, CollapsesRunsOfWhitespace) {
    auto words = execkit::split("  ls\t-l \n  /tmp  ");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"ls", "-l", "/tmp"}));
}

TEST(Split, DoubleQuotesEscapeOnlyQuoteAndBackslash) {
    auto words = execkit::split(R"(printf "say \"hi\" \\ \n $HOME")");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"printf", R"(say "hi" \ \n $HOME)"}));
}

TEST(Split, UnquotedBackslashEscapesNextCharacter) {
    auto words = execkit::split(R"(touch my\ file \'x)");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"touch", "my file", "'x"}));
}

TEST(Split, AdjacentSegmentsConcatenate) {
    auto words = execkit::split(R"(a'b c'"d"e)");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"ab cde"}));
}

TEST(Split, EmptyQuotesProduceEmptyWord) {
    auto words = execkit::split("cmd '' \"\" x");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"cmd", "", "", "x"}));
}

TEST(Split, ShellOperatorsAreLiteral) {
    auto words = execkit::split("cat *.txt | grep x > out");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (Args{"cat", "*.txt", "|", "grep", "x", ">", "out"}));
}

TEST(Split, ReportsUnterminatedQuotes) {
    EXPECT_FALSE(execkit::split("echo 'oops").has_value());
    EXPECT_FALSE(execkit::split("echo \"oops").has_value());
    EXPECT_FALSE(execkit::split("echo oops\\").has_value());
}

TEST(Split, BlankLineHasNoWords) {
    auto words = execkit::split("   ");
    ASSERT_TRUE(words.has_value());
    EXPECT_TRUE(words->empty());
}

TEST(Quote, LeavesSafeArgumentsAlone) {
    EXPECT_EQ(execkit::quote("/usr/bin/git"), "/usr/bin/git");
    EXPECT_EQ(execkit::quote("--depth=1"), "--depth=1");
}

TEST(Quote, WrapsUnsafeArguments) {
    EXPECT_EQ(execkit::quote(""), "''");
    EXPECT_EQ(execkit::quote("a b"), "'a b'");
    EXPECT_EQ(execkit::quote("it's"), R"('it'"'"'s')");
}

TEST(Quote, SplitReadsQuotedArgumentsBack) {
    Args args{"echo", "it's", "a b", "", "$x"};
    auto cmd = Command::from_args(args);
    ASSERT_TRUE(cmd.has_value());
    auto words = execkit::split(cmd->str());
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, args);
}

TEST(Command, ParseNormalizesToArguments) {
    auto cmd = Command::parse("echo 'a b' c");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->args(), (Args{"echo", "a b", "c"}));
    EXPECT_EQ(cmd->program(), "echo");
}

TEST(Command, ParseAndFromArgsAgree) {
    auto parsed = Command::parse("git log --oneline");
    auto built = Command::from_args({"git", "log", "--oneline"});
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(built.has_value());
    EXPECT_EQ(*parsed, *built);
}

TEST(Command, RejectsEmptyInput) {
    EXPECT_FALSE(Command::from_args({}).has_value());
    EXPECT_FALSE(Command::from_args({""}).has_value());
    EXPECT_FALSE(Command::parse("").has_value());
    EXPECT_FALSE(Command::parse("  \t ").has_value());
    EXPECT_FALSE(Command::parse("echo 'unterminated").has_value());
}

TEST(Command, FormatsAsQuotedLine) {
    auto cmd = Command::from_args({"echo", "a b"});
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(std::format("{}", *cmd), "echo 'a b'");
}
