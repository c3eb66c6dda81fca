// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <cstdlib> // setenv(), unsetenv()
#include <optional>
#include <string>
#include <string_view>

#include <libseedctl/converter.h>
#include <libseedctl/defaults.h>
#include <libseedctl/file.h>

#include "gtest/gtest.h"
#include "test-fixtures.h"

using namespace std::literals;

namespace libseedctl::test
{

class DefaultsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        save("XDG_CONFIG_HOME", old_config_);
        save("XDG_CACHE_HOME", old_cache_);
    }

    void TearDown() override
    {
        restore("XDG_CONFIG_HOME", old_config_);
        restore("XDG_CACHE_HOME", old_cache_);
    }

private:
    static void save(char const* key, std::optional<std::string>& setme)
    {
        if (auto const* const value = getenv(key); value != nullptr)
        {
            setme = value;
        }
    }

    static void restore(char const* key, std::optional<std::string> const& value)
    {
        if (value)
        {
            setenv(key, value->c_str(), 1);
        }
        else
        {
            unsetenv(key);
        }
    }

    std::optional<std::string> old_config_;
    std::optional<std::string> old_cache_;
};

TEST_F(DefaultsTest, followsXdgDirectories)
{
    setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    setenv("XDG_CACHE_HOME", "/xdg/cache", 1);

    EXPECT_EQ("/xdg/config/seedctl", default_config_dir());
    EXPECT_EQ("/xdg/config/seedctl/rc", default_rc_file());
    EXPECT_EQ("/xdg/cache/seedctl/history", default_history_file());
}

TEST_F(DefaultsTest, fallsBackToHome)
{
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_CACHE_HOME");

    EXPECT_EQ(sc_sys_path_home() + "/.config/seedctl", default_config_dir());
    EXPECT_EQ(sc_sys_path_home() + "/.cache/seedctl", default_cache_dir());
}

TEST_F(DefaultsTest, unlimitedLiterals)
{
    for (auto const str : { "off"sv, "OFF"sv, " none "sv, "Unlimited"sv, "∞"sv })
    {
        EXPECT_TRUE(is_unlimited_literal(str)) << str;
    }

    for (auto const str : { ""sv, "0"sv, "inf"sv, "no"sv })
    {
        EXPECT_FALSE(is_unlimited_literal(str)) << str;
    }
}

TEST_F(DefaultsTest, catalogsAreComplete)
{
    auto const local = local_catalog();
    EXPECT_EQ(21U, std::size(local));
    for (auto const& setting : local)
    {
        EXPECT_FALSE(std::empty(setting.description)) << setting.name;
    }

    auto api = FakeSettingsApi{};
    auto const bandwidth = DataCountConverter{};
    auto const remote = remote_catalog(api, bandwidth);
    EXPECT_EQ(15U, std::size(remote));
    for (auto const& [name, accessor] : remote)
    {
        EXPECT_TRUE(sc_strv_starts_with(name, "srv."sv)) << name;
        EXPECT_TRUE(accessor.fetch) << name;
        EXPECT_TRUE(accessor.push) << name;
    }
}

} // namespace libseedctl::test
