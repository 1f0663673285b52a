// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include "validator/luhn.hpp"
#include "validator/ssn_format.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const std::string_view input{reinterpret_cast<const char *>(data), size};

    const bool luhn = olval::validate_luhn(input);
    const bool ssn = olval::validate_ssn_format(input);

    // Both validators are pure, a second call must agree with the first
    if (luhn != olval::validate_luhn(input) || ssn != olval::validate_ssn_format(input)) {
        __builtin_trap();
    }

    // Nine digits can never pass the 13 to 19 digit gate
    if (luhn && ssn) {
        __builtin_trap();
    }

    return 0;
}
