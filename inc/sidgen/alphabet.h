// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_ALPHABET_H_INCLUDED
#define HEADER_SIDGEN_ALPHABET_H_INCLUDED

#include <sidgen/error.h>

#include <optional>
#include <ostream>
#include <algorithm>
#include <iterator>

namespace sidgen {

    /// Character set family an id is drawn from
    enum class id_style : uint8_t {
        alphanumeric,
        extended,
        hex
    };

    namespace impl {

        // Layout: upper case, lower case, digits, URL-safe symbols, reserved symbols.
        // Lower-case only alphabets are suffixes of the mixed case ones.
        inline constexpr std::string_view extended_chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~!$()*+,;=:";
        inline constexpr size_t upper_count = 26;
        inline constexpr size_t alnum_count = 62;
        inline constexpr size_t url_safe_count = 66;

        inline constexpr std::string_view hex_chars = "0123456789ABCDEFabcdef";
        inline constexpr std::string_view lower_hex_chars = "0123456789abcdef";

        [[noreturn]] SIDGEN_EXPORTED void raise_invalid_style(unsigned value);

        inline constexpr std::string_view style_names[] = {"alphanumeric", "extended", "hex"};
    }

    /**
     * Returns the ordered set of characters ids of the given style are drawn from
     *
     * @param style id style. A value outside of id_style enumerators fails with errc::invalid_style
     * @param only_lowercase drop upper case letters
     * @param url_safe only meaningful for id_style::extended. Excludes the reserved
     * `!$()*+,;=:` symbols
     */
    constexpr std::string_view resolve_alphabet(id_style style, bool only_lowercase, bool url_safe) {
        switch(style) {
            case id_style::hex:
                return only_lowercase ? impl::lower_hex_chars : impl::hex_chars;
            case id_style::alphanumeric:
            case id_style::extended: {
                size_t first = only_lowercase ? impl::upper_count : 0;
                size_t last = style == id_style::alphanumeric ? impl::alnum_count :
                              url_safe ? impl::url_safe_count : impl::extended_chars.size();
                return impl::extended_chars.substr(first, last - first);
            }
        }
        impl::raise_invalid_style(unsigned(style));
    }

    static_assert(resolve_alphabet(id_style::hex, false, true).size() == 22);
    static_assert(resolve_alphabet(id_style::hex, true, true).size() == 16);
    static_assert(resolve_alphabet(id_style::alphanumeric, false, false).size() == 62);
    static_assert(resolve_alphabet(id_style::alphanumeric, true, false).size() == 36);
    static_assert(resolve_alphabet(id_style::extended, false, true).size() == 66);
    static_assert(resolve_alphabet(id_style::extended, true, true).size() == 40);
    static_assert(resolve_alphabet(id_style::extended, false, false).size() == 76);
    static_assert(resolve_alphabet(id_style::extended, true, false).size() == 50);

    /// Returns the textual name of a style
    constexpr std::string_view to_string_view(id_style style) {
        if (size_t(style) >= std::size(impl::style_names))
            impl::raise_invalid_style(unsigned(style));
        return impl::style_names[size_t(style)];
    }

    /// Parses a style name. Returns nullopt for unknown names
    constexpr std::optional<id_style> parse_id_style(std::string_view name) noexcept {
        auto it = std::find(std::begin(impl::style_names), std::end(impl::style_names), name);
        if (it == std::end(impl::style_names))
            return std::nullopt;
        return id_style(it - std::begin(impl::style_names));
    }

    /// Parses a style name. Unknown names fail with errc::invalid_style
    SIDGEN_EXPORTED id_style id_style_from_string(std::string_view name);

    /// Prints style name into an ostream
    template<impl::char_like T>
    std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, id_style style) {
        auto name = to_string_view(style);
        std::copy(name.begin(), name.end(), std::ostreambuf_iterator<T>(str));
        return str;
    }

    namespace impl {
        template<class Derived, class CharT>
        struct style_formatter_base {
            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != CharT('}'))
                    static_cast<Derived *>(this)->raise_exception("Invalid format args");
                return it;
            }

            template <typename FormatContext>
            auto format(id_style val, FormatContext & ctx) const -> decltype(ctx.out()) {
                auto name = to_string_view(val);
                return std::transform(name.begin(), name.end(), ctx.out(), [](char c) { return CharT(c); });
            }
        };
    }
}

#if SIDGEN_SUPPORTS_STD_FORMAT

/// id_style formatter for std::format
template<class CharT>
struct std::formatter<::sidgen::id_style, CharT> :
    public ::sidgen::impl::style_formatter_base<std::formatter<::sidgen::id_style, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        SIDGEN_THROW(std::format_error(message));
    }
};

#endif

#if SIDGEN_SUPPORTS_FMT_FORMAT

/// id_style formatter for fmt::format
template<class CharT>
struct fmt::formatter<::sidgen::id_style, CharT> :
    public ::sidgen::impl::style_formatter_base<fmt::formatter<::sidgen::id_style, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
