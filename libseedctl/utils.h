// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <algorithm> // for std::for_each()
#include <cctype>
#include <cstddef> // size_t
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

struct sc_error;

/**
 * @addtogroup utils Utilities
 * @{
 */

// ---

/**
 * @brief Load a file into memory.
 *
 * @param[in]  filename Path to the file.
 * @param[out] contents Receives the file's bytes.
 * @param[out] error    Optional, set on failure.
 */
bool sc_file_read(std::string_view filename, std::vector<char>& contents, sc_error* error = nullptr);

/**
 * Tries to save a file safely. The file is written to a temporary file
 * beside the destination and then renamed over it.
 */
bool sc_file_save(std::string_view filename, std::string_view contents, sc_error* error = nullptr);

// ---

/** @brief Convenience wrapper around `strerorr()` guaranteed to not return nullptr
    @param errnum the error number to describe */
[[nodiscard]] char const* sc_strerror(int errnum);

template<typename T>
[[nodiscard]] std::string sc_strlower(T in)
{
    auto out = std::string{ std::move(in) };
    std::for_each(std::begin(out), std::end(out), [](char& ch) { ch = std::tolower(static_cast<unsigned char>(ch)); });
    return out;
}

// --- std::string_view utils

template<typename T>
[[nodiscard]] constexpr bool sc_strv_contains(std::string_view sv, T key) noexcept // c++23
{
    return sv.find(key) != std::string_view::npos;
}

[[nodiscard]] constexpr bool sc_strv_starts_with(std::string_view sv, char key) // c++20
{
    return !std::empty(sv) && sv.front() == key;
}

[[nodiscard]] constexpr bool sc_strv_starts_with(std::string_view sv, std::string_view key) // c++20
{
    return std::size(key) <= std::size(sv) && sv.substr(0, std::size(key)) == key;
}

[[nodiscard]] constexpr bool sc_strv_ends_with(std::string_view sv, std::string_view key) // c++20
{
    return std::size(key) <= std::size(sv) && sv.substr(std::size(sv) - std::size(key)) == key;
}

[[nodiscard]] constexpr bool sc_strv_ends_with(std::string_view sv, char key) // c++20
{
    return !std::empty(sv) && sv.back() == key;
}

constexpr std::string_view sc_strv_sep(std::string_view* sv, char delim)
{
    auto pos = sv->find(delim);
    auto const ret = sv->substr(0, pos);
    sv->remove_prefix(pos != std::string_view::npos ? pos + 1 : std::size(*sv));
    return ret;
}

constexpr bool sc_strv_sep(std::string_view* sv, std::string_view* token, char delim)
{
    if (std::empty(*sv))
    {
        return false;
    }

    *token = sc_strv_sep(sv, delim);
    return true;
}

// like sc_strv_sep(), but the delimiter may be longer than one character
constexpr std::string_view sc_strv_sep(std::string_view* sv, std::string_view delim)
{
    auto pos = std::empty(delim) ? std::string_view::npos : sv->find(delim);
    auto const ret = sv->substr(0, pos);
    sv->remove_prefix(pos != std::string_view::npos ? pos + std::size(delim) : std::size(*sv));
    return ret;
}

[[nodiscard]] std::string_view sc_strv_strip(std::string_view str);

/** @brief Number of code points in a UTF-8 string, or its byte length if the string is not valid UTF-8. */
[[nodiscard]] size_t sc_strv_utf8_length(std::string_view sv);

/**
 * @brief Greedy word wrap.
 *
 * Splits `text` on whitespace and packs words into lines no wider than `width`
 * code points. Words longer than `width` get a line of their own.
 * Every line but the first starts with `subsequent_indent`, which counts toward `width`.
 */
[[nodiscard]] std::vector<std::string> sc_strv_wrap(
    std::string_view text,
    size_t width,
    std::string_view subsequent_indent = {});

// ---

template<typename T, std::enable_if_t<std::is_integral_v<T>, bool> = true>
[[nodiscard]] std::optional<T> sc_num_parse(std::string_view str, std::string_view* setme_remainder = nullptr, int base = 10);

template<typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
[[nodiscard]] std::optional<T> sc_num_parse(std::string_view str, std::string_view* setme_remainder = nullptr);

// ---

/** @brief Check if environment variable exists. */
[[nodiscard]] bool sc_env_key_exists(char const* key);

/** @brief Get environment variable value as string. */
[[nodiscard]] std::string sc_env_get_string(std::string_view key, std::string_view default_value = {});

/** @} */
