// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_ERROR_H_INCLUDED
#define HEADER_SIDGEN_ERROR_H_INCLUDED

#include <sidgen/common.h>

#include <system_error>

namespace sidgen {

    /// Error conditions reported by the library
    enum class errc : int {
        missing_name = 1,
        configuration_not_found,
        invalid_length,
        invalid_style,
        random_source_failure
    };

    /// Returns the "sidgen" error category singleton
    SIDGEN_EXPORTED const std::error_category & error_category() noexcept;

    inline std::error_code make_error_code(errc e) noexcept {
        return std::error_code(int(e), error_category());
    }

    /**
     * Exception thrown by all library operations.
     *
     * `code()` compares equal to one of the errc values and `what()`
     * contains the offending name or value.
     */
    class id_error : public std::system_error {
    public:
        id_error(errc e, const std::string & what_arg):
            std::system_error(make_error_code(e), what_arg)
        {}
        id_error(errc e, const char * what_arg):
            std::system_error(make_error_code(e), what_arg)
        {}
    };

    namespace impl {
        [[noreturn]] SIDGEN_EXPORTED void raise(errc e, std::string_view detail);
    }
}

template<>
struct std::is_error_code_enum<sidgen::errc> : std::true_type {};

#endif
