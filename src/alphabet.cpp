// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <sidgen/alphabet.h>

using namespace sidgen;

void sidgen::impl::raise_invalid_style(unsigned value) {
    impl::raise(errc::invalid_style, "style value " + std::to_string(value));
}

auto sidgen::id_style_from_string(std::string_view name) -> id_style {
    if (auto style = parse_id_style(name))
        return *style;
    std::string detail = "style \"";
    detail += name;
    detail += '"';
    impl::raise(errc::invalid_style, detail);
}
