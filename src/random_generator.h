// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_SIDGEN_RANDOM_GENERATOR_H_INCLUDED

#include <cstdint>
#include <span>


namespace sidgen::impl {

    /// Fills dest from the OpenSSL CSPRNG. Fails with errc::random_source_failure
    void fill_secure_random(std::span<uint8_t> dest);
}

#endif
