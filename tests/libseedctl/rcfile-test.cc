// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cstdlib> // setenv(), unsetenv()
#include <string>
#include <string_view>
#include <vector>

#include <libseedctl/error-types.h>
#include <libseedctl/error.h>
#include <libseedctl/file.h>
#include <libseedctl/rcfile.h>
#include <libseedctl/utils.h>

#include "gtest/gtest.h"
#include "test-fixtures.h"

using namespace std::literals;

namespace libseedctl::test
{

using RcFileTest = ::testing::Test;

TEST_F(RcFileTest, parse)
{
    auto const text =
        "# a comment\n"
        "\n"
        "set connect.host example.org\n"
        "   # indented comment\n"
        "set columns.torrents name \\\n"
        "    size \\\n"
        "    ratio\n"
        "  bind q quit  \n"sv;

    auto const expected = std::vector<std::string>{
        "set connect.host example.org",
        "set columns.torrents name size ratio",
        "bind q quit",
    };

    EXPECT_EQ(expected, rc_parse(text));
    EXPECT_TRUE(std::empty(rc_parse("")));
    EXPECT_EQ((std::vector<std::string>{ "set a b" }), rc_parse("set a \\\nb \\"));
}

TEST_F(RcFileTest, readMissingFile)
{
    auto const sandbox = Sandbox{};
    auto const filename = fmt::format("{:s}/nope", sandbox.path());

    auto error = sc_error{};
    EXPECT_FALSE(rc_read(filename, &error));
    EXPECT_TRUE(sc_error_is_enoent(error.code()));
    EXPECT_EQ(fmt::format("{:s}: {:s}", filename, sc_strerror(ENOENT)), error.message());
}

TEST_F(RcFileTest, writeAndRead)
{
    auto const sandbox = Sandbox{};
    auto const filename = fmt::format("{:s}/sub/dir/rc", sandbox.path());

    auto error = sc_error{};
    EXPECT_TRUE(rc_write(filename, "set tui.poll 1\n", false, &error)) << error;

    auto const commands = rc_read(filename, &error);
    ASSERT_TRUE(commands) << error;
    EXPECT_EQ((std::vector<std::string>{ "set tui.poll 1" }), *commands);

    EXPECT_FALSE(rc_write(filename, "set tui.poll 2\n", false, &error));
    EXPECT_EQ(SC_ERROR_EEXIST, error.code());
    EXPECT_EQ(fmt::format("File exists: {:s}", filename), error.message());

    error = {};
    EXPECT_TRUE(rc_write(filename, "set tui.poll 2\n", true, &error)) << error;
    EXPECT_EQ((std::vector<std::string>{ "set tui.poll 2" }), rc_read(filename).value_or(std::vector<std::string>{}));
}

TEST_F(RcFileTest, filepath)
{
    auto const sandbox = Sandbox{};

    EXPECT_EQ("/etc/seedctl/rc", rc_filepath("/etc/seedctl/rc", sandbox.path()));
    EXPECT_EQ("./rc", rc_filepath("./rc", sandbox.path()));
    EXPECT_EQ(fmt::format("{:s}/rc.alt", sandbox.path()), rc_filepath("rc.alt", sandbox.path()));
    EXPECT_EQ(fmt::format("{:s}/rc", sc_sys_path_home()), rc_filepath("~/rc", sandbox.path()));
}

TEST_F(RcFileTest, quote)
{
    EXPECT_EQ("''", rc_quote(""));
    EXPECT_EQ("plain", rc_quote("plain"));
    EXPECT_EQ("'two words'", rc_quote("two words"));
    EXPECT_EQ("'#hash'", rc_quote("#hash"));
    EXPECT_EQ(R"("it's \"quoted\"")", rc_quote(R"(it's "quoted")"));
    EXPECT_EQ(R"("back\\slash'")", rc_quote(R"(back\slash')"));
}

} // namespace libseedctl::test
