// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cstdlib> // setenv(), unsetenv()
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libseedctl/utils.h>

#include "test-fixtures.h"

using UtilsTest = ::testing::Test;
using namespace std::literals;

TEST_F(UtilsTest, scStrvContains)
{
    EXPECT_FALSE(sc_strv_contains("a test is this"sv, "TEST"sv));
    EXPECT_TRUE(sc_strv_contains(" test "sv, "tes"sv));
    EXPECT_TRUE(sc_strv_contains("test"sv, ""sv));
    EXPECT_TRUE(sc_strv_contains("test"sv, 'e'));
}

TEST_F(UtilsTest, scStrvStartsAndEndsWith)
{
    EXPECT_TRUE(sc_strv_starts_with("+=10"sv, "+="sv));
    EXPECT_FALSE(sc_strv_starts_with("+10"sv, "+="sv));
    EXPECT_TRUE(sc_strv_starts_with("#set"sv, '#'));
    EXPECT_FALSE(sc_strv_starts_with(""sv, '#'));

    EXPECT_TRUE(sc_strv_ends_with("connect.host:eval"sv, ":eval"sv));
    EXPECT_FALSE(sc_strv_ends_with("eval"sv, ":eval"sv));
    EXPECT_TRUE(sc_strv_ends_with("line \\"sv, '\\'));
}

TEST_F(UtilsTest, scStrvSep)
{
    auto sv = "up,,down"sv;
    auto token = std::string_view{};

    EXPECT_TRUE(sc_strv_sep(&sv, &token, ','));
    EXPECT_EQ("up"sv, token);
    EXPECT_TRUE(sc_strv_sep(&sv, &token, ','));
    EXPECT_EQ(""sv, token);
    EXPECT_TRUE(sc_strv_sep(&sv, &token, ','));
    EXPECT_EQ("down"sv, token);
    EXPECT_FALSE(sc_strv_sep(&sv, &token, ','));

    sv = "a, b, c"sv;
    EXPECT_EQ("a"sv, sc_strv_sep(&sv, ", "sv));
    EXPECT_EQ("b, c"sv, sv);
}

TEST_F(UtilsTest, scStrvStrip)
{
    EXPECT_EQ(""sv, sc_strv_strip("              "sv));
    EXPECT_EQ("test test"sv, sc_strv_strip("    test test     "sv));
    EXPECT_EQ("test"sv, sc_strv_strip("   test     "sv));
    EXPECT_EQ("test"sv, sc_strv_strip("\t\ntest\n"sv));
    EXPECT_EQ(""sv, sc_strv_strip(""sv));
}

TEST_F(UtilsTest, scStrlower)
{
    EXPECT_EQ("sideways"sv, sc_strlower("SideWays"sv));
    EXPECT_EQ(""sv, sc_strlower(""sv));
}

TEST_F(UtilsTest, scStrvUtf8Length)
{
    EXPECT_EQ(0U, sc_strv_utf8_length(""sv));
    EXPECT_EQ(5U, sc_strv_utf8_length("hello"sv));
    EXPECT_EQ(1U, sc_strv_utf8_length("✔"sv));
    EXPECT_EQ(1U, sc_strv_utf8_length("∞"sv));
    EXPECT_EQ(3U, sc_strv_utf8_length("a∞b"sv));

    // invalid UTF-8 falls back to the byte count
    EXPECT_EQ(2U, sc_strv_utf8_length("\xff\xfe"sv));
}

TEST_F(UtilsTest, scStrvWrap)
{
    EXPECT_TRUE(std::empty(sc_strv_wrap(""sv, 10U)));
    EXPECT_TRUE(std::empty(sc_strv_wrap("   "sv, 10U)));

    EXPECT_EQ((std::vector<std::string>{ "one two" }), sc_strv_wrap("one   two"sv, 10U));
    EXPECT_EQ((std::vector<std::string>{ "one two", "three four", "five" }), sc_strv_wrap("one two three four five"sv, 10U));

    // overlong words get a line of their own
    EXPECT_EQ((std::vector<std::string>{ "a", "abcdefghijkl", "b" }), sc_strv_wrap("a abcdefghijkl b"sv, 10U));
}

TEST_F(UtilsTest, scStrvWrapIndent)
{
    auto const lines = sc_strv_wrap("# one two three four"sv, 10U, "# "sv);
    EXPECT_EQ((std::vector<std::string>{ "# one two", "# three", "# four" }), lines);

    // indentation counts toward the width, but an indent alone is never a line
    EXPECT_EQ((std::vector<std::string>{ "aaaaa", "    bbbbbbbbbb" }), sc_strv_wrap("aaaaa bbbbbbbbbb"sv, 8U, "    "sv));
}

TEST_F(UtilsTest, scNumParse)
{
    EXPECT_EQ(42, sc_num_parse<int>("42"sv));
    EXPECT_EQ(-1, sc_num_parse<int>("-1"sv));
    EXPECT_FALSE(sc_num_parse<int>("abc"sv));

    auto remainder = std::string_view{};
    EXPECT_EQ(12U, sc_num_parse<unsigned int>("12kB"sv, &remainder));
    EXPECT_EQ("kB"sv, remainder);

    auto const val = sc_num_parse<double>("1.5Ki"sv, &remainder);
    ASSERT_TRUE(val);
    EXPECT_DOUBLE_EQ(1.5, *val);
    EXPECT_EQ("Ki"sv, remainder);
    EXPECT_FALSE(sc_num_parse<double>("Ki"sv));
}

TEST_F(UtilsTest, env)
{
    static auto constexpr Key = "SEEDCTL_TEST_ENV";

    unsetenv(Key);
    EXPECT_FALSE(sc_env_key_exists(Key));
    EXPECT_EQ("fallback", sc_env_get_string(Key, "fallback"sv));

    setenv(Key, "value", 1);
    EXPECT_TRUE(sc_env_key_exists(Key));
    EXPECT_EQ("value", sc_env_get_string(Key, "fallback"sv));

    unsetenv(Key);
}
