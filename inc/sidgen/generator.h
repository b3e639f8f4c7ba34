// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_GENERATOR_H_INCLUDED
#define HEADER_SIDGEN_GENERATOR_H_INCLUDED

#include <sidgen/generate.h>

#include <map>
#include <vector>

namespace sidgen {

    /**
     * Id generator with a registry of named configurations
     *
     * Registry operations are safe to call concurrently when SIDGEN_MULTITHREADED
     * is enabled. Concurrent writes to the same name are resolved last writer wins.
     * Id generation itself does not hold the registry lock.
     */
    class SIDGEN_EXPORTED id_generator {
    public:
        using options_map = std::map<std::string, id_config_options>;

    public:
        /// Constructs a generator with an empty registry
        id_generator() = default;

        /**
         * Constructs a generator with an initial registry
         *
         * Each entry is normalized immediately and stored under its key. The key
         * overrides any name present in the options.
         */
        explicit id_generator(const options_map & initial);

        id_generator(const id_generator & src);
        id_generator(id_generator && src) noexcept;
        id_generator & operator=(const id_generator & src);
        id_generator & operator=(id_generator && src) noexcept;
        ~id_generator() noexcept = default;

        /**
         * Creates an id from ad-hoc parameters
         *
         * Missing parameters take defaults. A zero length is treated as missing.
         * The resulting configuration is not stored.
         */
        auto create(std::optional<int> length = std::nullopt,
                    std::optional<id_style> style = std::nullopt,
                    std::optional<bool> only_lowercase = std::nullopt,
                    std::optional<bool> url_safe = std::nullopt) const -> std::string;

        /// Registers or overwrites a named configuration. Fails with errc::missing_name if options.name is empty
        void add(const id_config_options & options);

        /// Removes a named configuration if present. Fails with errc::missing_name if options.name is empty
        void remove(const id_config_options & options);

        /// Removes a named configuration if present. Fails with errc::missing_name if name is empty
        void remove(std::string_view name);

        /// Creates an id from a named configuration. Fails with errc::configuration_not_found if not registered
        auto custom(std::string_view name) const -> std::string;

        auto contains(std::string_view name) const -> bool;

        /// Returns a copy of a named configuration
        auto find(std::string_view name) const -> std::optional<id_config>;

        auto size() const -> size_t;

        /// Returns registered names in sorted order
        auto names() const -> std::vector<std::string>;

    private:
        using registry_type = std::map<std::string, id_config, std::less<>>;

        mutable impl::mutex_if_multithreaded m_mutex;
        registry_type m_registry;
    };
}

#endif
