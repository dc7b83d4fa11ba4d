#include "shell_words.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mcpharbor;

TEST(ShellWords, SplitsOnWhitespace) {
    auto w = split_shell_words("  npx   -y  @scope/pkg\t--flag ");
    ASSERT_EQ(w.size(), 4u);
    EXPECT_EQ(w[0], "npx");
    EXPECT_EQ(w[1], "-y");
    EXPECT_EQ(w[2], "@scope/pkg");
    EXPECT_EQ(w[3], "--flag");
}

TEST(ShellWords, EmptyInputYieldsNoWords) {
    EXPECT_TRUE(split_shell_words("").empty());
    EXPECT_TRUE(split_shell_words("   \t ").empty());
}

TEST(ShellWords, SingleQuotesAreLiteral) {
    auto w = split_shell_words("echo 'a \"b\" \\n $HOME'");
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[1], "a \"b\" \\n $HOME");
}

TEST(ShellWords, DoubleQuotesHonorEscapes) {
    auto w = split_shell_words("run \"say \\\"hi\\\" \\$x\"");
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[1], "say \"hi\" $x");
}

TEST(ShellWords, BackslashEscapesOutsideQuotes) {
    auto w = split_shell_words("a\\ b c");
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[0], "a b");
    EXPECT_EQ(w[1], "c");
}

TEST(ShellWords, AdjacentQuotedPartsJoin) {
    auto w = split_shell_words("--opt='x y'z");
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0], "--opt=x yz");
}

TEST(ShellWords, EmptyQuotedWordIsKept) {
    auto w = split_shell_words("cmd '' x");
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[1], "");
}

TEST(ShellWords, UnterminatedQuoteThrows) {
    EXPECT_THROW(split_shell_words("echo 'oops"), std::invalid_argument);
    EXPECT_THROW(split_shell_words("echo \"oops"), std::invalid_argument);
    EXPECT_THROW(split_shell_words("echo oops\\"), std::invalid_argument);
}

TEST(ShellWords, QuotedWordsSurviveJoin) {
    std::vector<std::string> words = {"npm", "install", "-g", "pkg with space", "it's", ""};
    EXPECT_EQ(split_shell_words(join_shell_words(words)), words);
}

TEST(ShellWords, PlainWordsAreNotQuoted) {
    EXPECT_EQ(quote_shell_word("@scope/pkg"), "@scope/pkg");
    EXPECT_EQ(join_shell_words({"uv", "pip", "install", "--system", "x"}), "uv pip install --system x");
}
