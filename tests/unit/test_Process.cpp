#include "shell/Process.hpp"
#include "fs/errors.hpp"

#include <gtest/gtest.h>

using namespace ds::shell;

TEST(ProcessTest, CapturesOutputLines) {
    const auto res = run({"sh", "-c", "printf 'one\\ntwo\\r\\nthree'"});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ProcessTest, MergesStderr) {
    const auto res = run({"sh", "-c", "echo out; echo err >&2"});
    EXPECT_EQ(res.lines.size(), 2u);
}

TEST(ProcessTest, ReportsExitCode) {
    const auto res = run({"sh", "-c", "exit 3"});
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_TRUE(res.lines.empty());
}

TEST(ProcessTest, ArgumentsAreNotReinterpreted) {
    const auto res = run({"printf", "%s", "a b; $HOME"});
    EXPECT_EQ(res.lines, (std::vector<std::string>{"a b; $HOME"}));
}

TEST(ProcessTest, MissingProgramThrows) {
    EXPECT_THROW(run({"devsync-no-such-program"}), ds::fs::OperationFailed);
    EXPECT_THROW(run({}), ds::fs::OperationFailed);
}

TEST(ProcessTest, QuoteProducesShellWords) {
    EXPECT_EQ(quote("plain"), "'plain'");
    EXPECT_EQ(quote(""), "''");
    EXPECT_EQ(quote("it's"), R"('it'\''s')");
    EXPECT_EQ(quote("$HOME `x`"), "'$HOME `x`'");
}

TEST(ProcessTest, QuotedWordsSurviveARealShell) {
    for (const std::string word : {"two  spaces", "'single'", "\"double\"", "`tick`", "$HOME", "a;b", "#c", "(p)", "back\\slash"}) {
        const auto res = run({"sh", "-c", "printf '%s' " + quote(word)});
        ASSERT_EQ(res.lines.size(), 1u) << word;
        EXPECT_EQ(res.lines[0], word);
    }
}
