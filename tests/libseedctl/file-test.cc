// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cstdlib> // setenv(), unsetenv()
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include <libseedctl/error.h>
#include <libseedctl/file.h>
#include <libseedctl/utils.h>

#include "test-fixtures.h"

using namespace std::literals;

namespace libseedctl::test
{

using FileTest = ::testing::Test;

TEST_F(FileTest, pathIsRelative)
{
    EXPECT_TRUE(sc_sys_path_is_relative(""));
    EXPECT_TRUE(sc_sys_path_is_relative("rc"));
    EXPECT_TRUE(sc_sys_path_is_relative("./rc"));
    EXPECT_FALSE(sc_sys_path_is_relative("/etc/rc"));
}

TEST_F(FileTest, pathBasename)
{
    EXPECT_EQ("."sv, sc_sys_path_basename(""));
    EXPECT_EQ("/"sv, sc_sys_path_basename("//"));
    EXPECT_EQ("a"sv, sc_sys_path_basename("a"));
    EXPECT_EQ("rc"sv, sc_sys_path_basename("/home/user/.config/seedctl/rc"));
    EXPECT_EQ("seedctl"sv, sc_sys_path_basename("/home/user/.config/seedctl/"));
}

TEST_F(FileTest, pathDirname)
{
    EXPECT_EQ("."sv, sc_sys_path_dirname(""));
    EXPECT_EQ("."sv, sc_sys_path_dirname("rc"));
    EXPECT_EQ("/"sv, sc_sys_path_dirname("/rc"));
    EXPECT_EQ("/"sv, sc_sys_path_dirname("/"));
    EXPECT_EQ("a"sv, sc_sys_path_dirname("a/b"));
    EXPECT_EQ("/home/user/.config/seedctl"sv, sc_sys_path_dirname("/home/user/.config/seedctl/rc"));
    EXPECT_EQ("/a"sv, sc_sys_path_dirname("/a/b//"));
}

TEST_F(FileTest, pathNormalize)
{
    EXPECT_EQ("."sv, sc_sys_path_normalize(""));
    EXPECT_EQ("."sv, sc_sys_path_normalize("./"));
    EXPECT_EQ("/"sv, sc_sys_path_normalize("/"));
    EXPECT_EQ("/foo/baz"sv, sc_sys_path_normalize("/foo/./bar/../baz"));
    EXPECT_EQ("../a"sv, sc_sys_path_normalize("../a"));
    EXPECT_EQ("a"sv, sc_sys_path_normalize("a/b/.."));
    EXPECT_EQ("/a/b"sv, sc_sys_path_normalize("//a//b//"));
}

TEST_F(FileTest, pathExpanduser)
{
    auto const home = sc_sys_path_home();

    EXPECT_EQ(home, sc_sys_path_expanduser("~"));
    EXPECT_EQ(fmt::format("{:s}/rc", home), sc_sys_path_expanduser("~/rc"));
    EXPECT_EQ("~user/rc", sc_sys_path_expanduser("~user/rc"));
    EXPECT_EQ("/etc/rc", sc_sys_path_expanduser("/etc/rc"));
}

TEST_F(FileTest, dirCreateAndFileRoundTrip)
{
    auto const sandbox = Sandbox{};
    auto const dir = fmt::format("{:s}/a/b/c", sandbox.path());
    auto const filename = fmt::format("{:s}/file", dir);

    auto error = sc_error{};
    EXPECT_TRUE(sc_sys_dir_create(dir, 0777, &error)) << error;
    EXPECT_TRUE(sc_sys_path_exists(dir));

    // already there
    EXPECT_TRUE(sc_sys_dir_create(dir, 0777, &error)) << error;

    EXPECT_TRUE(sc_file_save(filename, "hello\n"sv, &error)) << error;

    auto contents = std::vector<char>{};
    EXPECT_TRUE(sc_file_read(filename, contents, &error)) << error;
    EXPECT_EQ("hello\n"sv, std::string_view(std::data(contents), std::size(contents)));

    EXPECT_FALSE(sc_sys_dir_create(fmt::format("{:s}/sub", filename), 0777, &error));
    EXPECT_EQ(ENOTDIR, error.code());
}

} // namespace libseedctl::test
