// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_generator.h"

#include <sidgen/error.h>

#include <openssl/rand.h>
#include <openssl/err.h>

#include <algorithm>
#include <limits>

namespace sidgen::impl {

    void fill_secure_random(std::span<uint8_t> dest) {

        //RAND_bytes takes int size
        constexpr size_t max_chunk = size_t(std::numeric_limits<int>::max());

        while (!dest.empty()) {
            size_t chunk = std::min(dest.size(), max_chunk);
            if (RAND_bytes(dest.data(), int(chunk)) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                raise(errc::random_source_failure, buf);
            }
            dest = dest.subspan(chunk);
        }
    }

}
