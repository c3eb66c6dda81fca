// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstdio> // remove()
#include <cstdlib> // getenv(), mkdtemp()
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <ftw.h>

#include <fmt/core.h>

#include <libseedctl/context.h>
#include <libseedctl/commands.h>
#include <libseedctl/error-types.h>
#include <libseedctl/error.h>
#include <libseedctl/keymap.h>
#include <libseedctl/stringables.h>
#include <libseedctl/transfer-api.h>
#include <libseedctl/utils.h>
#include <libseedctl/values.h>

#include "gtest/gtest.h"

using namespace std::literals;

inline std::ostream& operator<<(std::ostream& os, sc_error const& err)
{
    os << err.message() << ' ' << err.code();
    return os;
}

namespace libseedctl::test
{

class Sandbox
{
public:
    Sandbox()
        : sandbox_dir_{ create_sandbox(get_default_parent_dir(), "seedctl-test-XXXXXX") }
    {
    }

    ~Sandbox()
    {
        rimraf(sandbox_dir_);
    }

    Sandbox(Sandbox const&) = delete;
    Sandbox& operator=(Sandbox const&) = delete;

    [[nodiscard]] std::string const& path() const
    {
        return sandbox_dir_;
    }

protected:
    static std::string get_default_parent_dir()
    {
        if (auto* const path = getenv("TMPDIR"); path != nullptr)
        {
            return path;
        }

        return "/tmp";
    }

    static std::string create_sandbox(std::string const& parent_dir, std::string const& tmpl)
    {
        auto path = fmt::format("{:s}/{:s}", parent_dir, tmpl);
        if (mkdtemp(std::data(path)) == nullptr)
        {
            ADD_FAILURE() << "Couldn't create sandbox in '" << parent_dir << "'";
        }
        return path;
    }

    static void rimraf(std::string const& path)
    {
        nftw(
            path.c_str(),
            [](char const* filename, struct stat const* /*sb*/, int /*typeflag*/, struct FTW* /*ftw*/)
            { return ::remove(filename); },
            16,
            FTW_DEPTH | FTW_PHYS);
    }

private:
    std::string const sandbox_dir_;
};

// ---

// An in-memory daemon. `daemon` holds its session settings by RPC key.
class FakeSettingsApi final : public SettingsApi
{
public:
    FakeSettingsApi()
    {
        auto config = Number::Config{};
        config.unit = "B";
        limits.insert_or_assign(Direction::Up, *Number::make(Number::Infinity, Number::Type::Float, config));
        limits.insert_or_assign(Direction::Down, *Number::make(Number::Infinity, Number::Type::Float, config));
    }

    [[nodiscard]] bool update(sc_error* error) override
    {
        ++n_updates;

        if (!check_connected(error))
        {
            return false;
        }

        fetched_ = daemon;
        return true;
    }

    [[nodiscard]] std::optional<Input> get(std::string_view key, sc_error* /*error*/) const override
    {
        if (auto const iter = fetched_.find(key); iter != std::end(fetched_))
        {
            return Input{ iter->second };
        }

        return {};
    }

    [[nodiscard]] bool set(std::string_view key, Value const& value, sc_error* error) override
    {
        if (!check_connected(error))
        {
            return false;
        }

        // numbers go over the wire in full, not in their display form
        auto const* const number = as_number(value);
        auto str = number != nullptr ? number->to_string(false, true) : to_string(value);
        daemon.insert_or_assign(std::string{ key }, str);
        fetched_.insert_or_assign(std::string{ key }, std::move(str));
        return true;
    }

    [[nodiscard]] std::optional<Number> limit_rate(Direction direction, sc_error* error) const override
    {
        if (!check_connected(error))
        {
            return {};
        }

        return limits.at(direction);
    }

    [[nodiscard]] bool set_limit_rate(Direction direction, Number const& limit, sc_error* error) override
    {
        if (!check_connected(error))
        {
            return false;
        }

        limits.insert_or_assign(direction, limit);
        return true;
    }

    std::map<std::string, std::string, std::less<>> daemon = {
        { "autostart_torrents", "true" },
        { "dht", "true" },
        { "encryption", "preferred" },
        { "lpd", "false" },
        { "part_files", "true" },
        { "path_complete", "/srv/complete" },
        { "path_incomplete", "/srv/incomplete" },
        { "peer_limit_global", "500" },
        { "peer_limit_torrent", "50" },
        { "pex", "true" },
        { "port", "51413" },
        { "port_forwarding", "false" },
        { "utp", "true" },
    };

    std::map<Direction, Number> limits;

    bool connected = true;
    size_t n_updates = 0U;

private:
    bool check_connected(sc_error* error) const
    {
        if (!connected)
        {
            sc_error_set(error, SC_ERROR_CONNECTIVITY, "Connection refused");
        }

        return connected;
    }

    std::map<std::string, std::string, std::less<>> fetched_;
};

class FakeTorrentApi final : public TorrentApi
{
public:
    struct Call
    {
        std::string method;
        std::vector<std::string> filters;
        std::optional<Direction> direction;
        std::string limit;
    };

    [[nodiscard]] TorrentResponse torrents(std::vector<std::string> const& filters, std::vector<std::string> const& /*keys*/)
        override
    {
        calls.push_back({ "torrents", filters, {}, {} });
        return response;
    }

    [[nodiscard]] TorrentResponse set_limit_rate(
        std::vector<std::string> const& filters,
        Direction direction,
        std::string_view limit) override
    {
        calls.push_back({ "set_limit_rate", filters, direction, std::string{ limit } });
        return response;
    }

    [[nodiscard]] TorrentResponse adjust_limit_rate(
        std::vector<std::string> const& filters,
        Direction direction,
        std::string_view delta) override
    {
        calls.push_back({ "adjust_limit_rate", filters, direction, std::string{ delta } });
        return response;
    }

    TorrentResponse response = { true, {}, {}, {} };
    std::vector<Call> calls;
};

// Records every line. If a Context is attached, the line is split on
// whitespace and run through run_command().
class FakeCommandRunner final : public CommandRunner
{
public:
    [[nodiscard]] std::optional<bool> run(std::string_view line) override
    {
        lines.emplace_back(line);

        if (auto const iter = results.find(line); iter != std::end(results))
        {
            return iter->second;
        }

        if (ctx == nullptr)
        {
            return true;
        }

        auto argv = std::vector<std::string>{};
        auto iss = std::istringstream{ std::string{ line } };
        for (std::string word; iss >> word;)
        {
            argv.emplace_back(std::move(word));
        }

        return run_command(*ctx, argv);
    }

    Context* ctx = nullptr;
    std::map<std::string, std::optional<bool>, std::less<>> results;
    std::vector<std::string> lines;
};

class FakeKeyMap final : public KeyMap
{
public:
    [[nodiscard]] std::vector<std::string> contexts() const override
    {
        auto names = std::vector<std::string>{};
        for (auto const& [context, bindings] : map_)
        {
            names.emplace_back(context);
        }
        return names;
    }

    [[nodiscard]] std::vector<KeyBinding> bindings(std::string_view context) const override
    {
        auto const iter = map_.find(context);
        return iter != std::end(map_) ? iter->second : std::vector<KeyBinding>{};
    }

    [[nodiscard]] bool bind(KeyBinding const& binding, sc_error* error) override
    {
        if (binding.key == rejected_key)
        {
            sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Invalid key: {:s}", binding.key));
            return false;
        }

        map_[binding.context].push_back(binding);
        return true;
    }

    [[nodiscard]] size_t size() const
    {
        auto n = size_t{};
        for (auto const& [context, bindings] : map_)
        {
            n += std::size(bindings);
        }
        return n;
    }

    std::string rejected_key;

private:
    std::map<std::string, std::vector<KeyBinding>, std::less<>> map_;
};

// ---

// A Context over fake collaborators. Messages meant for the user are collected
// in `infos` and `errors`.
class ContextTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ::testing::Test::SetUp();

        ctx_ = std::make_unique<Context>(settings_api_, torrent_api_, &runner_, &keymap_);
        ctx_->set_info_handler([this](std::string_view msg) { infos_.emplace_back(msg); });
        ctx_->set_error_handler([this](std::string_view msg) { errors_.emplace_back(msg); });
        ctx_->set_config_dir(sandbox_.path());
    }

    void TearDown() override
    {
        ctx_.reset();

        ::testing::Test::TearDown();
    }

    [[nodiscard]] Context& ctx()
    {
        return *ctx_;
    }

    [[nodiscard]] std::string value_of(std::string_view name)
    {
        auto const* const value = ctx_->settings().get(name);
        return value != nullptr ? to_string(*value) : "<null>"s;
    }

    Sandbox sandbox_;
    FakeSettingsApi settings_api_;
    FakeTorrentApi torrent_api_;
    FakeCommandRunner runner_;
    FakeKeyMap keymap_;

    std::vector<std::string> infos_;
    std::vector<std::string> errors_;

private:
    std::unique_ptr<Context> ctx_;
};

} // namespace libseedctl::test
