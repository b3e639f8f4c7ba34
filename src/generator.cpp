// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <sidgen/generator.h>

#include <mutex>

using namespace sidgen;

static void require_name(std::string_view name) {
    if (name.empty())
        impl::raise(errc::missing_name, "id configuration");
}

id_generator::id_generator(const options_map & initial) {
    for (auto & [name, options]: initial) {
        auto config = normalize(options);
        config.name = name;
        this->m_registry.insert_or_assign(name, std::move(config));
    }
}

id_generator::id_generator(const id_generator & src) {
    std::lock_guard lock(src.m_mutex);
    this->m_registry = src.m_registry;
}

id_generator::id_generator(id_generator && src) noexcept {
    std::lock_guard lock(src.m_mutex);
    this->m_registry = std::move(src.m_registry);
}

id_generator & id_generator::operator=(const id_generator & src) {
    if (this != &src) {
        registry_type copy;
        {
            std::lock_guard lock(src.m_mutex);
            copy = src.m_registry;
        }
        std::lock_guard lock(this->m_mutex);
        this->m_registry = std::move(copy);
    }
    return *this;
}

id_generator & id_generator::operator=(id_generator && src) noexcept {
    if (this != &src) {
        std::scoped_lock lock(this->m_mutex, src.m_mutex);
        this->m_registry = std::move(src.m_registry);
    }
    return *this;
}

auto id_generator::create(std::optional<int> length,
                          std::optional<id_style> style,
                          std::optional<bool> only_lowercase,
                          std::optional<bool> url_safe) const -> std::string {
    id_config_options options;
    options.length = length;
    options.style = style;
    options.only_lowercase = only_lowercase;
    options.url_safe = url_safe;
    return generate_id(normalize(options));
}

void id_generator::add(const id_config_options & options) {
    require_name(options.name ? std::string_view(*options.name) : std::string_view());

    auto config = normalize(options);
    std::string name = config.name;
    std::lock_guard lock(this->m_mutex);
    this->m_registry.insert_or_assign(std::move(name), std::move(config));
}

void id_generator::remove(const id_config_options & options) {
    this->remove(options.name ? std::string_view(*options.name) : std::string_view());
}

void id_generator::remove(std::string_view name) {
    require_name(name);

    std::lock_guard lock(this->m_mutex);
    if (auto it = this->m_registry.find(name); it != this->m_registry.end())
        this->m_registry.erase(it);
}

auto id_generator::custom(std::string_view name) const -> std::string {
    auto config = this->find(name);
    if (!config) {
        std::string detail = "name '";
        detail += name;
        detail += '\'';
        impl::raise(errc::configuration_not_found, detail);
    }
    return generate_id(*config);
}

auto id_generator::contains(std::string_view name) const -> bool {
    std::lock_guard lock(this->m_mutex);
    return this->m_registry.find(name) != this->m_registry.end();
}

auto id_generator::find(std::string_view name) const -> std::optional<id_config> {
    std::lock_guard lock(this->m_mutex);
    if (auto it = this->m_registry.find(name); it != this->m_registry.end())
        return it->second;
    return std::nullopt;
}

auto id_generator::size() const -> size_t {
    std::lock_guard lock(this->m_mutex);
    return this->m_registry.size();
}

auto id_generator::names() const -> std::vector<std::string> {
    std::lock_guard lock(this->m_mutex);
    std::vector<std::string> ret;
    ret.reserve(this->m_registry.size());
    for (auto & [name, config]: this->m_registry)
        ret.push_back(name);
    return ret;
}
