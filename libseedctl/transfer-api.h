// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "libseedctl/stringables.h"
#include "libseedctl/values.h"

struct sc_error;

namespace libseedctl
{
enum class Direction
{
    Up,
    Down
};

[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

// Accepts "up", "down" and "dn", case-insensitive.
[[nodiscard]] std::optional<Direction> direction_from_string(std::string_view str);

/**
 * The daemon's session settings, as seen through its RPC interface.
 *
 * Implementations report transport failures with SC_ERROR_CONNECTIVITY
 * and rejected values with SC_ERROR_VALIDATION.
 */
class SettingsApi
{
public:
    virtual ~SettingsApi() = default;

    // Fetch every setting in one round trip. get() serves values from the last successful update().
    [[nodiscard]] virtual bool update(sc_error* error) = 0;

    // A daemon setting by its RPC key, e.g. "peer_limit_global", or nullopt if it was never fetched.
    [[nodiscard]] virtual std::optional<Input> get(std::string_view key, sc_error* error) const = 0;

    [[nodiscard]] virtual bool set(std::string_view key, Value const& value, sc_error* error) = 0;

    // The global rate limit, with infinity meaning "no limit".
    [[nodiscard]] virtual std::optional<Number> limit_rate(Direction direction, sc_error* error) const = 0;

    [[nodiscard]] virtual bool set_limit_rate(Direction direction, Number const& limit, sc_error* error) = 0;
};

// The outcome of a request that touches a selection of torrents.
struct TorrentResponse
{
    bool success = false;

    // one key -> value map per matching torrent
    std::vector<std::map<std::string, std::string, std::less<>>> torrents;

    // informational messages and errors the daemon reported
    std::vector<std::string> messages;
    std::vector<std::string> errors;
};

class TorrentApi
{
public:
    virtual ~TorrentApi() = default;

    [[nodiscard]] virtual TorrentResponse torrents(
        std::vector<std::string> const& filters,
        std::vector<std::string> const& keys) = 0;

    [[nodiscard]] virtual TorrentResponse set_limit_rate(
        std::vector<std::string> const& filters,
        Direction direction,
        std::string_view limit) = 0;

    // `delta` is a signed number, e.g. "+100k" or "-1M"
    [[nodiscard]] virtual TorrentResponse adjust_limit_rate(
        std::vector<std::string> const& filters,
        Direction direction,
        std::string_view delta) = 0;
};

// Routes a command line to its handler.
// Returns false when the command failed and nullopt when it does not apply to the current interface.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    [[nodiscard]] virtual std::optional<bool> run(std::string_view line) = 0;
};

} // namespace libseedctl
