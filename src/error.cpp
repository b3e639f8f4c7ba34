// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <sidgen/error.h>

using namespace sidgen;

namespace {

    class sidgen_category : public std::error_category {
    public:
        const char * name() const noexcept override {
            return "sidgen";
        }

        std::string message(int code) const override {
            switch (errc(code)) {
                case errc::missing_name:            return "missing name for the id configuration";
                case errc::configuration_not_found: return "id configuration not found";
                case errc::invalid_length:          return "id length must be positive";
                case errc::invalid_style:           return "unknown id style, must be one of \"extended\", \"alphanumeric\" or \"hex\"";
                case errc::random_source_failure:   return "secure random source failure";
            }
            return "unknown sidgen error";
        }
    };
}

const std::error_category & sidgen::error_category() noexcept {
    static const sidgen_category instance;
    return instance;
}

void sidgen::impl::raise(errc e, std::string_view detail) {
    SIDGEN_THROW(id_error(e, std::string(detail)));
}
