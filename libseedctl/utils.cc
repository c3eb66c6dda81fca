// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <cerrno>
#include <charconv> // std::from_chars()
#include <cstdlib> // getenv()
#include <cstring> // strerror()
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error> // std::errc
#include <vector>

#include <fast_float/fast_float.h>

#include <utf8.h>

#include "libseedctl/utils.h"

using namespace std::literals;

char const* sc_strerror(int errnum)
{
    if (char const* const ret = strerror(errnum); ret != nullptr)
    {
        return ret;
    }

    return "Unknown Error";
}

// ---

std::string_view sc_strv_strip(std::string_view str)
{
    auto constexpr Test = [](auto ch)
    {
        return isspace(static_cast<unsigned char>(ch));
    };

    auto const it = std::find_if_not(std::begin(str), std::end(str), Test);
    str.remove_prefix(std::distance(std::begin(str), it));

    auto const rit = std::find_if_not(std::rbegin(str), std::rend(str), Test);
    str.remove_suffix(std::distance(std::rbegin(str), rit));

    return str;
}

size_t sc_strv_utf8_length(std::string_view sv)
{
    auto const* const begin = std::data(sv);
    auto const* const end = begin + std::size(sv);

    if (!utf8::is_valid(begin, end))
    {
        return std::size(sv);
    }

    return static_cast<size_t>(utf8::distance(begin, end));
}

std::vector<std::string> sc_strv_wrap(std::string_view text, size_t width, std::string_view subsequent_indent)
{
    auto const indent_len = sc_strv_utf8_length(subsequent_indent);

    auto lines = std::vector<std::string>{};
    auto line = std::string{};
    auto line_len = size_t{};

    auto constexpr IsSpace = [](char ch)
    {
        return isspace(static_cast<unsigned char>(ch)) != 0;
    };

    while (!std::empty(text))
    {
        auto const word_begin = std::find_if_not(std::begin(text), std::end(text), IsSpace);
        auto const word_end = std::find_if(word_begin, std::end(text), IsSpace);
        auto const word = text.substr(word_begin - std::begin(text), word_end - word_begin);
        text.remove_prefix(word_end - std::begin(text));

        if (std::empty(word))
        {
            break;
        }

        auto const word_len = sc_strv_utf8_length(word);
        auto const has_words = line_len > (std::empty(lines) ? 0U : indent_len);
        if (has_words && line_len + 1U + word_len > width)
        {
            lines.emplace_back(std::move(line));
            line.assign(subsequent_indent);
            line_len = indent_len;
        }
        else if (has_words)
        {
            line += ' ';
            ++line_len;
        }

        line += word;
        line_len += word_len;
    }

    if (line_len > (std::empty(lines) ? 0U : indent_len))
    {
        lines.emplace_back(std::move(line));
    }

    return lines;
}

// ---

bool sc_env_key_exists(char const* key)
{
    return getenv(key) != nullptr;
}

std::string sc_env_get_string(std::string_view key, std::string_view default_value)
{
    auto const szkey = std::string{ key };

    if (auto const* const value = getenv(szkey.c_str()); value != nullptr)
    {
        return value;
    }

    return std::string{ default_value };
}

// ---

template<typename T, std::enable_if_t<std::is_integral_v<T>, bool>>
[[nodiscard]] std::optional<T> sc_num_parse(std::string_view str, std::string_view* remainder, int base)
{
    auto val = T{};
    auto const* const begin_ch = std::data(str);
    auto const* const end_ch = begin_ch + std::size(str);
    auto const result = std::from_chars(begin_ch, end_ch, val, base);
    if (result.ec != std::errc{})
    {
        return std::nullopt;
    }
    if (remainder != nullptr)
    {
        *remainder = str;
        remainder->remove_prefix(result.ptr - std::data(str));
    }
    return val;
}

template std::optional<long long> sc_num_parse(std::string_view str, std::string_view* remainder, int base);
template std::optional<long> sc_num_parse(std::string_view str, std::string_view* remainder, int base);
template std::optional<int> sc_num_parse(std::string_view str, std::string_view* remainder, int base);

template std::optional<unsigned long long> sc_num_parse(std::string_view str, std::string_view* remainder, int base);
template std::optional<unsigned long> sc_num_parse(std::string_view str, std::string_view* remainder, int base);
template std::optional<unsigned int> sc_num_parse(std::string_view str, std::string_view* remainder, int base);

template<typename T, std::enable_if_t<std::is_floating_point_v<T>, bool>>
[[nodiscard]] std::optional<T> sc_num_parse(std::string_view str, std::string_view* remainder)
{
    auto const* const begin_ch = std::data(str);
    auto const* const end_ch = begin_ch + std::size(str);
    auto val = T{};
    auto const result = fast_float::from_chars(begin_ch, end_ch, val);
    if (result.ec != std::errc{})
    {
        return std::nullopt;
    }
    if (remainder != nullptr)
    {
        *remainder = str;
        remainder->remove_prefix(result.ptr - std::data(str));
    }
    return val;
}

template std::optional<double> sc_num_parse(std::string_view sv, std::string_view* remainder);
