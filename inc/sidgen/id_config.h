// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_ID_CONFIG_H_INCLUDED
#define HEADER_SIDGEN_ID_CONFIG_H_INCLUDED

#include <sidgen/alphabet.h>

#include <optional>

namespace sidgen {

    inline constexpr int default_length = 16;
    inline constexpr bool default_only_lowercase = false;
    inline constexpr id_style default_style = id_style::extended;
    inline constexpr bool default_url_safe = true;

    /// Fully resolved id generation parameters
    struct id_config {
        std::string name;
        int length = default_length;
        bool only_lowercase = default_only_lowercase;
        id_style style = default_style;
        bool url_safe = default_url_safe;

        friend bool operator==(const id_config & lhs, const id_config & rhs) = default;

        /// Returns the alphabet ids with this configuration are drawn from
        constexpr std::string_view alphabet() const
            { return resolve_alphabet(this->style, this->only_lowercase, this->url_safe); }
    };

    /// Partially specified id generation parameters. Missing fields take defaults
    struct id_config_options {
        std::optional<std::string> name;
        std::optional<int> length;
        std::optional<bool> only_lowercase;
        std::optional<id_style> style;
        std::optional<bool> url_safe;
    };

    /**
     * Merges options over the defaults
     *
     * A missing or zero length is replaced by default_length. Negative lengths
     * are kept as is and rejected when an id is generated.
     */
    inline id_config normalize(const id_config_options & options) {
        id_config ret;
        if (options.name)
            ret.name = *options.name;
        if (options.length && *options.length != 0)
            ret.length = *options.length;
        ret.only_lowercase = options.only_lowercase.value_or(default_only_lowercase);
        ret.style = options.style.value_or(default_style);
        ret.url_safe = options.url_safe.value_or(default_url_safe);
        return ret;
    }
}

#endif
