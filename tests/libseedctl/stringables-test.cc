// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cstdlib> // setenv(), unsetenv()
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libseedctl/error-types.h>
#include <libseedctl/error.h>
#include <libseedctl/stringables.h>

#include "gtest/gtest.h"
#include "test-fixtures.h"

using namespace std::literals;
using namespace libseedctl;

using StringablesTest = ::testing::Test;

TEST_F(StringablesTest, stringCountsCodePoints)
{
    auto config = String::Config{};
    config.minlen = 1U;
    config.maxlen = 1U;

    auto const str = String::make("✔", config);
    ASSERT_TRUE(str);
    EXPECT_EQ("✔"sv, str->value());
    EXPECT_EQ("string (1 character)", str->syntax());

    auto error = sc_error{};
    EXPECT_FALSE(String::make("ab", config, &error));
    EXPECT_EQ(SC_ERROR_VALIDATION, error.code());
    EXPECT_EQ("Too long (maximum length is 1)"sv, error.message());

    error = {};
    EXPECT_FALSE(String::make("", config, &error));
    EXPECT_EQ("Too short (minimum length is 1)"sv, error.message());
}

TEST_F(StringablesTest, stringSyntax)
{
    auto config = String::Config{};
    EXPECT_EQ("string", String::make("", config)->syntax());

    config.maxlen = 10U;
    EXPECT_EQ("string (at most 10 characters)", String::make("", config)->syntax());

    config.minlen = 2U;
    EXPECT_EQ("string (2-10 characters)", String::make("abc", config)->syntax());

    config.maxlen = String::Unlimited;
    EXPECT_EQ("string (at least 2 characters)", String::make("abc", config)->syntax());
}

TEST_F(StringablesTest, boolMapsWords)
{
    auto const yes = Bool::make("yes");
    ASSERT_TRUE(yes);
    EXPECT_TRUE(static_cast<bool>(*yes));
    EXPECT_EQ("enabled", yes->to_string());

    auto const zero = Bool::make("0");
    ASSERT_TRUE(zero);
    EXPECT_FALSE(zero->value());
    EXPECT_EQ("disabled", zero->to_string());

    EXPECT_EQ(*Bool::make("on"), *Bool::make("true"));

    auto error = sc_error{};
    EXPECT_FALSE(Bool::make("maybe", {}, &error));
    EXPECT_EQ("Not a boolean value: 'maybe'"sv, error.message());
}

TEST_F(StringablesTest, boolCustomWords)
{
    auto config = Bool::Config{};
    config.true_words = { "ja" };
    config.false_words = { "nein" };

    EXPECT_TRUE(Bool::make("ja", config)->value());
    EXPECT_FALSE(Bool::make("yes", config));
    EXPECT_EQ("ja/nein", Bool::make("nein", config)->syntax());
    EXPECT_EQ("enabled/disabled|yes/no|on/off|true/false|1/0", Bool::make("1")->syntax());
}

class PathTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        if (auto const* const home = getenv("HOME"); home != nullptr)
        {
            old_home_ = home;
        }

        setenv("HOME", "/home/tester", 1);
    }

    void TearDown() override
    {
        if (old_home_)
        {
            setenv("HOME", old_home_->c_str(), 1);
        }
        else
        {
            unsetenv("HOME");
        }
    }

private:
    std::optional<std::string> old_home_;
};

TEST_F(PathTest, normalizes)
{
    EXPECT_EQ("/foo/baz"sv, Path::make("/foo/./bar/../baz")->value());
    EXPECT_EQ("/foo"sv, Path::make("/foo//")->value());
    EXPECT_EQ("/"sv, Path::make("/..")->value());
    EXPECT_EQ("file system path"sv, Path::syntax());
}

TEST_F(PathTest, expandsAndAbbreviatesHome)
{
    auto const path = Path::make("~/downloads");
    ASSERT_TRUE(path);
    EXPECT_EQ("/home/tester/downloads"sv, path->value());
    EXPECT_EQ("~/downloads", path->to_string());

    EXPECT_EQ("~", Path::make("/home/tester")->to_string());

    // only at a path component boundary
    EXPECT_EQ("/home/testerX/a", Path::make("/home/testerX/a")->to_string());
}

TEST_F(PathTest, abbreviatesHomeWithTrailingSlash)
{
    setenv("HOME", "/home/tester/", 1);

    auto const path = Path::make("~/downloads");
    ASSERT_TRUE(path);
    EXPECT_EQ("/home/tester/downloads"sv, path->value());
    EXPECT_EQ("~/downloads", path->to_string());
    EXPECT_EQ("~", Path::make("/home/tester")->to_string());
}

TEST_F(PathTest, mustExist)
{
    auto config = Path::Config{};
    config.mustexist = true;

    EXPECT_TRUE(Path::make("/", config));

    auto error = sc_error{};
    EXPECT_FALSE(Path::make("/no/such/seedctl/path", config, &error));
    EXPECT_EQ("No such file or directory"sv, error.message());
}

TEST_F(StringablesTest, tupleSplitsAndDedups)
{
    auto config = Tuple::Config{};
    config.dedup = true;

    auto const tuple = Tuple::make("a, b, a", config);
    ASSERT_TRUE(tuple);
    EXPECT_EQ((std::vector<std::string>{ "a", "b" }), tuple->items());
    EXPECT_EQ("a, b", tuple->to_string());

    // list input is flattened and each item is split too
    auto const list = Tuple::make(std::vector<std::string>{ "x,y", "z" }, config);
    ASSERT_TRUE(list);
    EXPECT_EQ((std::vector<std::string>{ "x", "y", "z" }), list->items());

    auto const empty = Tuple::make("", config);
    ASSERT_TRUE(empty);
    EXPECT_EQ(0U, empty->size());
    EXPECT_EQ("", empty->to_string());
}

TEST_F(StringablesTest, tupleKeepsDuplicatesWithoutDedup)
{
    auto const tuple = Tuple::make("a,b,a");
    ASSERT_TRUE(tuple);
    EXPECT_EQ(3U, tuple->size());
}

TEST_F(StringablesTest, tupleResolvesAliasesAndChecksOptions)
{
    auto config = Tuple::Config{};
    config.options = std::vector<std::string>{ "up", "down" };
    config.aliases = { { "dn", "down" } };

    auto const tuple = Tuple::make("up, dn", config);
    ASSERT_TRUE(tuple);
    EXPECT_EQ((std::vector<std::string>{ "up", "down" }), tuple->items());

    auto error = sc_error{};
    EXPECT_FALSE(Tuple::make("up, left, right", config, &error));
    EXPECT_EQ("Invalid options: left, right"sv, error.message());

    error = {};
    EXPECT_FALSE(Tuple::make("left", config, &error));
    EXPECT_EQ("Invalid option: left"sv, error.message());

    EXPECT_EQ("<OPTION>,<OPTION>,...", tuple->syntax());
}

TEST_F(StringablesTest, optionResolvesAliases)
{
    auto config = Option::Config{};
    config.options = { "up", "down" };
    config.aliases = { { "dn", "down" } };

    auto const option = Option::make("dn", config);
    ASSERT_TRUE(option);
    EXPECT_EQ("down"sv, option->value());
    EXPECT_EQ("up|down", option->syntax());

    auto error = sc_error{};
    EXPECT_FALSE(Option::make("sideways", config, &error));
    EXPECT_EQ("Not one of: up, down"sv, error.message());
}

TEST_F(StringablesTest, convertUsesPrototype)
{
    auto config = Number::Config{};
    config.min = 1;
    auto const prototype = Value{ *Number::make(10, Number::Type::Integer, config) };

    auto const value = convert(prototype, Input{ "5.4"s });
    ASSERT_TRUE(value);
    ASSERT_NE(nullptr, as_number(*value));
    EXPECT_TRUE(as_number(*value)->is_integer());
    EXPECT_EQ(5.0, as_number(*value)->value());

    auto error = sc_error{};
    EXPECT_FALSE(convert(prototype, Input{ "0"s }, &error));
    EXPECT_EQ("Too small (minimum is 1)"sv, error.message());
}

TEST_F(StringablesTest, convertNumbersToPrototypeUnit)
{
    auto config = Number::Config{};
    config.unit = "B";
    auto const prototype = Value{ *Number::make(0, Number::Type::Float, config) };

    auto value = convert(prototype, Input{ "8kb"s });
    ASSERT_TRUE(value);
    EXPECT_EQ(1000.0, as_number(*value)->value());
    EXPECT_EQ("1kB", to_string(*value));

    value = convert(prototype, Input{ *Number::make(16, Number::Type::Float, Number::Config{ "b" }) });
    ASSERT_TRUE(value);
    EXPECT_EQ(2.0, as_number(*value)->value());
}

TEST_F(StringablesTest, convertOtherTypes)
{
    auto tuple_config = Tuple::Config{};
    tuple_config.dedup = true;
    auto const tuple = Value{ *Tuple::make("a", tuple_config) };

    auto value = convert(tuple, Input{ std::vector<std::string>{ "b", "c", "b" } });
    ASSERT_TRUE(value);
    EXPECT_TRUE(is_sequence(*value));
    EXPECT_EQ("b, c", to_string(*value));

    value = convert(Value{ *Bool::make("no") }, Input{ "on"s });
    ASSERT_TRUE(value);
    EXPECT_EQ("enabled", to_string(*value));

    value = convert(Value{ *String::make("") }, Input{ std::vector<std::string>{ "hello", "world" } });
    ASSERT_TRUE(value);
    EXPECT_EQ("hello world", to_string(*value));

    auto error = sc_error{};
    EXPECT_FALSE(convert(Value{ *Bool::make("no") }, Input{ "perhaps"s }, &error));
    EXPECT_TRUE(sc_error_is_validation(error.code()));
}

TEST_F(StringablesTest, syntaxOfValues)
{
    EXPECT_EQ("[+|-]<NUMBER>[Ti|Gi|Mi|Ki|T|G|M|k]", syntax(Value{ Number{} }));
    EXPECT_EQ("file system path", syntax(Value{ *Path::make("/") }));
}

TEST_F(StringablesTest, inputToString)
{
    EXPECT_EQ("a, b", to_string(Input{ std::vector<std::string>{ "a", "b" } }));
    EXPECT_EQ("abc", to_string(Input{ "abc"s }));
}
