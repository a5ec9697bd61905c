#include <gtest/gtest.h>

#include "manip/string_manip.hpp"

using string_manip::split;
using string_manip::token_list;

TEST(SplitTest, CamelCase)
{
    EXPECT_EQ(split("fooBarBaz"), (token_list{ "foo", "Bar", "Baz" }));
}

TEST(SplitTest, SnakeCase)
{
    EXPECT_EQ(split("foo_bar_baz"), (token_list{ "foo", "bar", "baz" }));
}

TEST(SplitTest, NoBoundaryReturnsWholeString)
{
    EXPECT_EQ(split("simple"), (token_list{ "simple" }));
}

TEST(SplitTest, EmptyInputGivesEmptyList)
{
    EXPECT_TRUE(split("").empty());
}

TEST(SplitTest, OnlySeparators)
{
    EXPECT_TRUE(split("__").empty());
    EXPECT_TRUE(split("-.-").empty());
}

TEST(SplitTest, NonIdentifierCharactersAreSeparators)
{
    EXPECT_EQ(split("my-project name.v2"), (token_list{ "my", "project", "name", "v2" }));
}

TEST(SplitTest, LeadingAndTrailingUnderscoresAddNothing)
{
    EXPECT_EQ(split("__foo__bar_"), (token_list{ "foo", "bar" }));
}

TEST(SplitTest, PascalCase)
{
    EXPECT_EQ(split("ProjectName"), (token_list{ "Project", "Name" }));
}

TEST(SplitTest, UpperCaseRunsSplitPerLetter)
{
    EXPECT_EQ(split("ABC"), (token_list{ "A", "B", "C" }));
    EXPECT_EQ(split("parseHTTP"), (token_list{ "parse", "H", "T", "T", "P" }));
}

TEST(SplitTest, DigitsStayInsideWords)
{
    EXPECT_EQ(split("utf8Decoder"), (token_list{ "utf8", "Decoder" }));
    EXPECT_EQ(split("2dArray"), (token_list{ "2d", "Array" }));
}

TEST(SplitTest, TokensConcatenateBackToNormalizedInput)
{
    const std::string input = "fooBar_bazQux";
    std::string joined;
    for (const auto& token : split(input))
    {
        joined += token;
    }
    EXPECT_EQ(joined, "fooBarbazQux");
}
