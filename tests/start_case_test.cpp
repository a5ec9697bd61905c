#include <gtest/gtest.h>

#include "manip/string_manip.hpp"

using string_manip::start_case;
using string_manip::start_case_word;
using string_manip::token_list;

TEST(StartCaseWordTest, Rules)
{
    EXPECT_EQ(start_case_word("HELLO"), "Hello");
    EXPECT_EQ(start_case_word("h"), "H");
    EXPECT_EQ(start_case_word(""), "");
    EXPECT_EQ(start_case_word("wORLD"), "World");
    EXPECT_EQ(start_case_word("9lives"), "9lives");
}

TEST(StartCaseListTest, EveryElementTransformed)
{
    const token_list words{ "HELLO", "h", "", "mIxEd" };
    EXPECT_EQ(start_case(words), (token_list{ "Hello", "H", "", "Mixed" }));
}

TEST(StartCaseListTest, OutOfPlaceLeavesInputUntouched)
{
    const token_list words{ "foo", "BAR" };
    token_list output;
    start_case(words, output);

    EXPECT_EQ(output, (token_list{ "Foo", "Bar" }));
    EXPECT_EQ(words, (token_list{ "foo", "BAR" }));
}

TEST(StartCaseListTest, OutputMayAliasInput)
{
    token_list words{ "foo", "BAR" };
    start_case(words, words);
    EXPECT_EQ(words, (token_list{ "Foo", "Bar" }));
}

TEST(StartCaseListTest, InPlace)
{
    token_list words{ "alpha", "BETA" };
    string_manip::start_case_in_place(words);
    EXPECT_EQ(words, (token_list{ "Alpha", "Beta" }));
}

TEST(StartCaseStringTest, MultiWordInputIsJoined)
{
    EXPECT_EQ(start_case(std::string("fooBarBaz")), "FooBarBaz");
    EXPECT_EQ(start_case(std::string("foo_bar_baz")), "FooBarBaz");
    EXPECT_EQ(start_case(std::string("my-project")), "MyProject");
}

TEST(StartCaseStringTest, SingleWord)
{
    EXPECT_EQ(start_case(std::string("simple")), "Simple");
    EXPECT_EQ(start_case(std::string("h")), "H");
    EXPECT_EQ(start_case(std::string("")), "");
}

TEST(StartCaseStringTest, CapitalsSplitIntoLetters)
{
    EXPECT_EQ(start_case(std::string("HELLO")), "HELLO");
}

TEST(StartCaseStringTest, ExplicitOutput)
{
    std::string output;
    start_case(std::string("foo_bar"), output);
    EXPECT_EQ(output, "FooBar");
}

TEST(StartCaseStringTest, Idempotent)
{
    for (const std::string input : { "fooBarBaz", "foo_bar", "simple", "HELLO", "", "a-b-c", "X11Display" })
    {
        const auto once = start_case(input);
        EXPECT_EQ(start_case(once), once) << input;
    }

    const token_list words{ "HELLO", "wOrLd", "" };
    EXPECT_EQ(start_case(start_case(words)), start_case(words));
}

TEST(StartCaseStringTest, SequenceAndStringFormsAgree)
{
    for (const std::string input : { "fooBarBaz", "foo_bar_baz", "my-project-name", "camelCaseWord" })
    {
        std::string joined;
        for (const auto& word : start_case(string_manip::split(input)))
        {
            joined += word;
        }
        EXPECT_EQ(joined, start_case(input)) << input;
    }
}
