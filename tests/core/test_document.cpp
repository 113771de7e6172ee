#include "sturdypatch/core/document.hpp"
#include <gtest/gtest.h>

namespace sturdypatch {

TEST(DocumentTest, SplitsMixedLineEndings)
{
    auto lines = split_physical_lines("one\r\ntwo\nthree");

    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0].text, "one");
    EXPECT_EQ(lines[0].line_ending, LineEnding::CRLF);
    EXPECT_EQ(lines[1].text, "two");
    EXPECT_EQ(lines[1].line_ending, LineEnding::LF);
    EXPECT_EQ(lines[2].text, "three");
    EXPECT_EQ(lines[2].line_ending, LineEnding::NONE);
}

TEST(DocumentTest, TerminatedFinalLineAddsNoEmptyLine)
{
    auto lines = split_physical_lines("a\nb\n");

    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[1].line_ending, LineEnding::LF);
}

TEST(DocumentTest, EmptyTextHasNoLines)
{
    EXPECT_TRUE(split_physical_lines("").empty());
    EXPECT_TRUE(build_document("").empty());
}

TEST(DocumentTest, LoneCarriageReturnStaysInLine)
{
    auto document = build_document("a\rb\n");

    ASSERT_EQ(document.size(), 1);
    EXPECT_EQ(document[0].content, "a\rb");
}

TEST(DocumentTest, RoundTripsArbitraryText)
{
    const std::vector<std::string> samples{
        "",
        "\n",
        "\r\n\r\n",
        "single line",
        "def f():\n    return 1\n",
        "mixed\r\nendings\nhere\r\nno newline at end",
        "  \t\n\t  trailing  \r\n   \n",
        "\xEF\xBB\xBFwith bom\r\n",
    };

    for (const auto& text : samples) {
        EXPECT_EQ(render_document(build_document(text)), text) << "text: " << text;
    }
}

TEST(DocumentTest, CopiesCompareEqual)
{
    auto document = build_document("a\nb\n");
    auto copy = document;

    EXPECT_EQ(copy, document);
    EXPECT_EQ(build_document("a\nb\n"), document);
    EXPECT_NE(build_document("a\nb"), document);
}

TEST(DocumentTest, DominantLineEndingPrefersMajority)
{
    EXPECT_EQ(dominant_line_ending(build_document("a\r\nb\r\nc\n")), LineEnding::CRLF);
    EXPECT_EQ(dominant_line_ending(build_document("a\r\nb\n")), LineEnding::LF);
    EXPECT_EQ(dominant_line_ending(build_document("a")), LineEnding::LF);
}

TEST(DocumentTest, TokenizeBlockDiscardsFormatting)
{
    auto tokens = tokenize_block("    if x:\r\n        y = 1  \n\n    end");

    ASSERT_EQ(tokens.size(), 4);
    EXPECT_EQ(tokens[0], "if x:");
    EXPECT_EQ(tokens[1], "y = 1");
    EXPECT_EQ(tokens[2], "");
    EXPECT_EQ(tokens[3], "end");
}

TEST(DocumentTest, TokenizeEmptyBlockGivesNoTokens)
{
    EXPECT_TRUE(tokenize_block("").empty());
}

TEST(DocumentTest, HasContentRequiresNonBlankToken)
{
    std::vector<std::string> blank_tokens{"", ""};
    std::vector<std::string> tokens{"", "x"};

    EXPECT_FALSE(has_content(blank_tokens));
    EXPECT_TRUE(has_content(tokens));
    EXPECT_FALSE(has_content(tokenize_block("  \n\t\n")));
}

} // namespace sturdypatch
