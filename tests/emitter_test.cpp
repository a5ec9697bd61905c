#include <gtest/gtest.h>

#include "output/emitter.hpp"

#include <rapidjson/document.h>

using string_manip::assignment;
using namespace string_manip::output;

TEST(EmitterTest, ParseFormat)
{
    format fmt = format::plain;
    EXPECT_TRUE(parse_format("JSON", fmt));
    EXPECT_EQ(fmt, format::json);
    EXPECT_TRUE(parse_format(" cmake ", fmt));
    EXPECT_EQ(fmt, format::cmake);
    EXPECT_FALSE(parse_format("yaml", fmt));
    EXPECT_EQ(fmt, format::cmake);
}

TEST(EmitterTest, PlainIsTheValue)
{
    EXPECT_EQ(emit({ "words", "foo;Bar", true }, format::plain), "foo;Bar");
}

TEST(EmitterTest, CMakeSetCommand)
{
    EXPECT_EQ(emit({ "words", "foo;Bar", true }, format::cmake), "set(words \"foo;Bar\")");
}

TEST(EmitterTest, CMakeEscaping)
{
    EXPECT_EQ(escape_cmake_argument(R"(a"b\c$d)"), R"(a\"b\\c\$d)");
    EXPECT_EQ(emit({ "flags", "$<TARGET_FILE:x>", false }, format::cmake), "set(flags \"\\$<TARGET_FILE:x>\")");
}

TEST(EmitterTest, JsonListBecomesArray)
{
    const auto text = emit({ "words", "foo;Bar;Baz", true }, format::json);

    rapidjson::Document doc;
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());
    ASSERT_TRUE(doc.HasMember("words"));

    const auto& words = doc["words"];
    ASSERT_TRUE(words.IsArray());
    ASSERT_EQ(words.Size(), 3u);
    EXPECT_STREQ(words[0].GetString(), "foo");
    EXPECT_STREQ(words[2].GetString(), "Baz");
}

TEST(EmitterTest, JsonStringStaysString)
{
    EXPECT_EQ(emit({ "name", "a;b", false }, format::json), R"({"name":"a;b"})");
    EXPECT_EQ(emit({ "empty", "", true }, format::json), R"({"empty":[]})");
}

TEST(EmitterTest, JsonIndent)
{
    const auto text = emit({ "name", "Foo", false }, format::json, 2);
    EXPECT_EQ(text, "{\n  \"name\": \"Foo\"\n}");
}
