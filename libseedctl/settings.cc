// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/settings.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
void set_not_found(sc_error* error, std::string_view name)
{
    sc_error_set(error, SC_ERROR_NOT_FOUND, fmt::format("Unknown setting: {:s}", name));
}

template<typename Map>
[[nodiscard]] std::vector<std::string> sorted_keys(Map const& map)
{
    auto names = std::vector<std::string>{};
    names.reserve(std::size(map));
    for (auto const& [name, entry] : map)
    {
        names.emplace_back(name);
    }
    return names;
}
} // namespace

// --- LocalSettings

void LocalSettings::load(std::vector<LocalSetting> catalog)
{
    for (auto& setting : catalog)
    {
        auto value = setting.default_value;
        entries_.insert_or_assign(
            std::move(setting.name),
            Entry{ std::move(setting.default_value), std::move(value), std::move(setting.description) });
    }
}

LocalSettings::Entry const* LocalSettings::find(std::string_view name) const
{
    auto const iter = entries_.find(name);
    return iter != std::end(entries_) ? &iter->second : nullptr;
}

bool LocalSettings::contains(std::string_view name) const noexcept
{
    return entries_.find(name) != std::end(entries_);
}

Value const* LocalSettings::get(std::string_view name) const
{
    auto const* const entry = find(name);
    return entry != nullptr ? &entry->value : nullptr;
}

Value const* LocalSettings::default_value(std::string_view name) const
{
    auto const* const entry = find(name);
    return entry != nullptr ? &entry->default_value : nullptr;
}

std::string_view LocalSettings::description(std::string_view name) const
{
    auto const* const entry = find(name);
    return entry != nullptr ? std::string_view{ entry->description } : ""sv;
}

bool LocalSettings::set(std::string_view name, Input const& input, sc_error* error)
{
    auto const iter = entries_.find(name);
    if (iter == std::end(entries_))
    {
        set_not_found(error, name);
        return false;
    }

    auto value = convert(iter->second.value, input, error);
    if (!value)
    {
        return false;
    }

    iter->second.value = std::move(*value);
    sc_logAddDebug(fmt::format("{:s} = {:s}", name, to_string(iter->second.value)));
    changed_.notify(iter->first);
    return true;
}

bool LocalSettings::reset(std::string_view name, sc_error* error)
{
    auto const iter = entries_.find(name);
    if (iter == std::end(entries_))
    {
        set_not_found(error, name);
        return false;
    }

    iter->second.value = iter->second.default_value;
    sc_logAddDebug(fmt::format("Reset {:s} to {:s}", name, to_string(iter->second.value)));
    changed_.notify(iter->first);
    return true;
}

std::vector<std::string> LocalSettings::names() const
{
    return sorted_keys(entries_);
}

// --- RemoteSettings

RemoteSettings::RemoteSettings(Refresh refresh)
    : refresh_{ std::move(refresh) }
{
}

void RemoteSettings::load(std::vector<std::pair<std::string, RemoteAccessor>> catalog)
{
    for (auto& [name, accessor] : catalog)
    {
        entries_.insert_or_assign(std::move(name), Entry{ std::move(accessor), std::nullopt });
    }
}

bool RemoteSettings::update(sc_error* error)
{
    if (refresh_ && !refresh_(error))
    {
        return false;
    }

    auto first_error = sc_error{};
    for (auto& [name, entry] : entries_)
    {
        auto local_error = sc_error{};
        if (auto value = entry.accessor.fetch(&local_error); value)
        {
            entry.cached = std::move(value);
            continue;
        }

        sc_logAddDebug(fmt::format("Couldn't fetch {:s}: {:s}", name, local_error.message()));
        if (!first_error)
        {
            first_error = std::move(local_error);
        }
    }

    if (first_error)
    {
        sc_error_propagate(error, std::move(first_error));
        return false;
    }

    return true;
}

bool RemoteSettings::contains(std::string_view name) const noexcept
{
    return entries_.find(name) != std::end(entries_);
}

Value const* RemoteSettings::get(std::string_view name) const
{
    if (auto const iter = entries_.find(name); iter != std::end(entries_) && iter->second.cached)
    {
        return &*iter->second.cached;
    }

    return nullptr;
}

Value const* RemoteSettings::prototype(std::string_view name) const
{
    auto const iter = entries_.find(name);
    return iter != std::end(entries_) ? &iter->second.accessor.prototype : nullptr;
}

std::string_view RemoteSettings::description(std::string_view name) const
{
    auto const iter = entries_.find(name);
    return iter != std::end(entries_) ? std::string_view{ iter->second.accessor.description } : ""sv;
}

bool RemoteSettings::set(std::string_view name, Input const& input, sc_error* error)
{
    auto const iter = entries_.find(name);
    if (iter == std::end(entries_))
    {
        set_not_found(error, name);
        return false;
    }

    auto& [accessor, cached] = iter->second;
    auto value = accessor.coerce ? accessor.coerce(input, error) : convert(accessor.prototype, input, error);
    if (!value)
    {
        return false;
    }

    if (!accessor.push(*value, error))
    {
        return false;
    }

    sc_logAddDebug(fmt::format("Pushed {:s} = {:s}", name, to_string(*value)));
    cached = std::move(value);
    return true;
}

std::vector<std::string> RemoteSettings::names() const
{
    return sorted_keys(entries_);
}

// --- CombinedSettings

bool CombinedSettings::contains(std::string_view name) const noexcept
{
    return local_.contains(name) || remote_.contains(name);
}

bool CombinedSettings::is_remote(std::string_view name) const noexcept
{
    return !local_.contains(name) && remote_.contains(name);
}

Value const* CombinedSettings::get(std::string_view name) const
{
    if (auto const* const value = local_.get(name); value != nullptr)
    {
        return value;
    }

    return remote_.get(name);
}

std::string_view CombinedSettings::description(std::string_view name) const
{
    return local_.contains(name) ? local_.description(name) : remote_.description(name);
}

bool CombinedSettings::update(sc_error* error)
{
    return remote_.update(error);
}

bool CombinedSettings::set(std::string_view name, Input const& input, sc_error* error)
{
    if (local_.contains(name))
    {
        return local_.set(name, input, error);
    }

    if (remote_.contains(name))
    {
        return remote_.set(name, input, error);
    }

    set_not_found(error, name);
    return false;
}

bool CombinedSettings::reset(std::string_view name, sc_error* error)
{
    if (local_.contains(name))
    {
        return local_.reset(name, error);
    }

    if (remote_.contains(name))
    {
        sc_error_set(error, SC_ERROR_NOT_IMPLEMENTED, fmt::format("Remote settings cannot be reset: {:s}", name));
        return false;
    }

    set_not_found(error, name);
    return false;
}

std::vector<std::string> CombinedSettings::names() const
{
    auto names = local_.names();
    auto remote = remote_.names();
    names.insert(std::end(names), std::make_move_iterator(std::begin(remote)), std::make_move_iterator(std::end(remote)));
    std::sort(std::begin(names), std::end(names));
    names.erase(std::unique(std::begin(names), std::end(names)), std::end(names));
    return names;
}

} // namespace libseedctl
