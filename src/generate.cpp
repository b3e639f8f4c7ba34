// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <sidgen/generate.h>

#include "random_generator.h"

#include <vector>

using namespace sidgen;

void sidgen::generate_id_into(const id_config & config, std::span<char> dest) {

    if (config.length <= 0)
        impl::raise(errc::invalid_length, "length " + std::to_string(config.length));

    const auto alphabet = config.alphabet();

    if (dest.size() != size_t(config.length))
        impl::raise(errc::invalid_length, "buffer size " + std::to_string(dest.size()) +
                                          " does not match length " + std::to_string(config.length));

    const size_t mask = impl::sampling_mask(alphabet.size());
    const size_t step = impl::sampling_step(mask, dest.size(), alphabet.size());

    std::vector<uint8_t> bytes(step);
    auto out = dest.begin();

    while (out != dest.end()) {
        impl::fill_secure_random(bytes);

        for (auto b: bytes) {
            size_t idx = b & mask;
            if (idx >= alphabet.size())
                continue;
            *out++ = alphabet[idx];
            if (out == dest.end())
                break;
        }
    }
}

auto sidgen::generate_id(const id_config & config) -> std::string {

    if (config.length <= 0)
        impl::raise(errc::invalid_length, "length " + std::to_string(config.length));

    std::string ret(size_t(config.length), '\0');
    generate_id_into(config, ret);
    return ret;
}
