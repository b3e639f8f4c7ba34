// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SIDGEN_COMMON_H_INCLUDED
#define HEADER_SIDGEN_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// SIDGEN_MULTITHREADED - auto-detected. Set to 1 to force multi-threaded build and 0 to force single threaded 1
// SIDGEN_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// SIDGEN_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// SIDGEN_BUILDING_SIDGEN - set 1 if building the library itself.

#include <cstdint>
#include <cstdlib>
#include <cstdio>

#include <concepts>
#include <type_traits>
#include <span>
#include <string>
#include <string_view>

#if !defined(SIDGEN_MULTITHREADED)
    #if defined(_MSC_VER) && !defined(_MT)
        #define SIDGEN_MULTITHREADED 0
    #elif defined(_LIBCPP_VERSION) && (defined(_LIBCPP_HAS_NO_THREADS) || defined(_LIBCPP_HAS_THREADS) && !_LIBCPP_HAS_THREADS)
        #define SIDGEN_MULTITHREADED 0
    #elif defined(__GLIBCXX__) && !_GLIBCXX_HAS_GTHREADS
        #define SIDGEN_MULTITHREADED 0
    #elif !__has_include(<thread>) || !__has_include(<mutex>)
        #define SIDGEN_MULTITHREADED 0
    #else
        #define SIDGEN_MULTITHREADED 1
    #endif
#endif

#if !defined(SIDGEN_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define SIDGEN_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define SIDGEN_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define SIDGEN_USE_EXCEPTIONS 0
    #else
        #define SIDGEN_USE_EXCEPTIONS 1
    #endif
#endif

#if SIDGEN_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if SIDGEN_BUILDING_SIDGEN
            #define SIDGEN_EXPORTED __declspec(dllexport)
        #else
            #define SIDGEN_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define SIDGEN_EXPORTED [[gnu::visibility("default")]]
    #else
        #define SIDGEN_EXPORTED
    #endif
#else
    #define SIDGEN_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define SIDGEN_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define SIDGEN_SUPPORTS_FMT_FORMAT 1

#endif

#if SIDGEN_USE_FMT && !SIDGEN_SUPPORTS_FMT_FORMAT

    #error "SIDGEN_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if SIDGEN_SUPPORTS_STD_FORMAT
    #include <format>
#endif

#if SIDGEN_MULTITHREADED
    #include <mutex>
#endif

namespace sidgen
{
    namespace impl {

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        #if SIDGEN_USE_EXCEPTIONS
            #define SIDGEN_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "sidgen: fatal error: %s", message);
                abort();
            }
            #define SIDGEN_THROW(x) ::sidgen::impl::fail((x).what())
        #endif

        struct null_mutex {
            void lock() {}
            bool try_lock() { return true; }
            void unlock() {}
        };

        #if SIDGEN_MULTITHREADED
            using mutex_if_multithreaded = std::mutex;
        #else
            using mutex_if_multithreaded = null_mutex;
        #endif
    }
}

#endif
