// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <string>
#include <string_view>

#include <libseedctl/error-types.h>
#include <libseedctl/error.h>
#include <libseedctl/subprocess.h>
#include <libseedctl/value-resolution.h>

#include "gtest/gtest.h"
#include "test-fixtures.h"

using namespace std::literals;

using SubprocessTest = ::testing::Test;

TEST_F(SubprocessTest, capturesStandardOutput)
{
    auto error = sc_error{};
    auto const result = sc_spawn_capture("echo hello", &error);
    ASSERT_TRUE(result) << error;
    EXPECT_EQ(0, sc_spawn_exit_code(*result));
    EXPECT_EQ("hello\n", result->out);
    EXPECT_EQ("", result->err);
}

TEST_F(SubprocessTest, capturesStandardErrorAndExitCode)
{
    auto error = sc_error{};
    auto const result = sc_spawn_capture("echo out; echo err >&2; exit 3", &error);
    ASSERT_TRUE(result) << error;
    EXPECT_EQ(3, sc_spawn_exit_code(*result));
    EXPECT_EQ("out\n", result->out);
    EXPECT_EQ("err\n", result->err);
}

TEST_F(SubprocessTest, capturesLargeOutput)
{
    // more than a pipe buffer holds
    auto const result = sc_spawn_capture("yes x | head -n 50000");
    ASSERT_TRUE(result);
    EXPECT_EQ(100000U, std::size(result->out));
    EXPECT_EQ("x\nx\n", result->out.substr(0, 4));
}

TEST_F(SubprocessTest, unknownCommandWritesToStandardError)
{
    auto const result = sc_spawn_capture("seedctl-no-such-command-xyzzy");
    ASSERT_TRUE(result);
    EXPECT_EQ(127, sc_spawn_exit_code(*result));
    EXPECT_FALSE(std::empty(result->err));
}

TEST_F(SubprocessTest, evalShell)
{
    auto error = sc_error{};
    auto const output = libseedctl::eval_shell("printf '\\n\\nabc\\n\\n'", &error);
    ASSERT_TRUE(output) << error;
    EXPECT_EQ("abc", *output);

    // a failing command that is silent is not an error
    EXPECT_EQ("", libseedctl::eval_shell("false").value_or("<failed>"));

    error = {};
    EXPECT_FALSE(libseedctl::eval_shell("echo oh no >&2", &error));
    EXPECT_EQ(SC_ERROR_SHELL, error.code());
    EXPECT_EQ("oh no"sv, error.message());
}
