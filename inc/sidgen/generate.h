// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_GENERATE_H_INCLUDED
#define HEADER_SIDGEN_GENERATE_H_INCLUDED

#include <sidgen/id_config.h>

namespace sidgen {

    namespace impl {

        /// Smallest 2^k - 1 that covers all indices in [0, alphabet_size)
        constexpr size_t sampling_mask(size_t alphabet_size) noexcept {
            size_t mask = 1;
            while (mask < alphabet_size - 1)
                mask = (mask << 1) | 1;
            return mask;
        }

        /**
         * Number of random bytes requested per batch: ceil(1.6 * mask * length / alphabet_size)
         *
         * The 1.6 factor makes a second batch unlikely given the mask/alphabet_size
         * rejection ratio.
         */
        constexpr size_t sampling_step(size_t mask, size_t length, size_t alphabet_size) noexcept {
            const size_t num = 16 * mask * length;
            const size_t den = 10 * alphabet_size;
            return num / den + (num % den != 0);
        }

        static_assert(sampling_mask(16) == 15);
        static_assert(sampling_mask(22) == 31);
        static_assert(sampling_mask(64) == 63);
        static_assert(sampling_mask(66) == 127);
        static_assert(sampling_step(63, 21, 64) == 34);
    }

    /**
     * Fills dest with a random id
     *
     * Every character is drawn uniformly and independently from config.alphabet()
     * using a cryptographically secure random source. dest.size() must equal
     * config.length.
     *
     * Fails with errc::invalid_length if config.length is not positive or does not
     * match dest.size(), errc::invalid_style for an unknown style and
     * errc::random_source_failure if secure random bytes cannot be obtained.
     */
    SIDGEN_EXPORTED void generate_id_into(const id_config & config, std::span<char> dest);

    /// Returns a new random id of config.length characters
    SIDGEN_EXPORTED std::string generate_id(const id_config & config);

    /// Returns a new random id as a string of the given character type
    template<impl::char_like CharT>
    auto generate_id(const id_config & config) -> std::basic_string<CharT> {
        if constexpr (std::is_same_v<CharT, char>) {
            return generate_id(config);
        } else {
            auto narrow = generate_id(config);
            std::basic_string<CharT> ret(narrow.size(), CharT(0));
            std::transform(narrow.begin(), narrow.end(), ret.begin(), [](char c) { return CharT(c); });
            return ret;
        }
    }
}

#endif
