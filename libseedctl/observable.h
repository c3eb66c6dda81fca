// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // for size_t
#include <functional>
#include <string>
#include <string_view>
#include <utility> // for std::exchange()

#include <small/map.hpp>

namespace libseedctl
{

// A subscription to a ChangeNotifier. Destroying it unsubscribes.
class ObserverTag
{
public:
    ObserverTag() = default;

    explicit ObserverTag(std::function<void()> unsubscribe)
        : unsubscribe_{ std::move(unsubscribe) }
    {
    }

    ObserverTag(ObserverTag&& that) noexcept
        : unsubscribe_{ std::exchange(that.unsubscribe_, nullptr) }
    {
    }

    ObserverTag& operator=(ObserverTag&& that) noexcept
    {
        reset();
        unsubscribe_ = std::exchange(that.unsubscribe_, nullptr);
        return *this;
    }

    ObserverTag(ObserverTag const&) = delete;
    ObserverTag& operator=(ObserverTag const&) = delete;

    ~ObserverTag()
    {
        reset();
    }

    void reset()
    {
        if (auto unsubscribe = std::exchange(unsubscribe_, nullptr); unsubscribe)
        {
            unsubscribe();
        }
    }

private:
    std::function<void()> unsubscribe_;
};

/**
 * Tells observers which setting changed.
 *
 * An observer watches either every setting or a single one by name.
 * Observers must not subscribe or unsubscribe from inside a notification.
 */
class ChangeNotifier
{
public:
    using Observer = std::function<void(std::string_view name)>;

    ChangeNotifier() = default;
    ChangeNotifier(ChangeNotifier const&) = delete;
    ChangeNotifier& operator=(ChangeNotifier const&) = delete;

    // every setting
    [[nodiscard]] ObserverTag observe(Observer observer)
    {
        return observe({}, std::move(observer));
    }

    [[nodiscard]] ObserverTag observe(std::string_view name, Observer observer)
    {
        auto const key = next_key_++;
        observers_.emplace(key, Entry{ std::string{ name }, std::move(observer) });
        return ObserverTag{ [this, key]() { observers_.erase(key); } };
    }

    void notify(std::string_view name) const
    {
        for (auto const& [key, entry] : observers_)
        {
            if (std::empty(entry.name) || entry.name == name)
            {
                entry.observer(name);
            }
        }
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return std::size(observers_);
    }

private:
    struct Entry
    {
        // empty for "every setting"
        std::string name;
        Observer observer;
    };

    size_t next_key_ = 1U;
    small::map<size_t, Entry, 4U> observers_;
};

} // namespace libseedctl
