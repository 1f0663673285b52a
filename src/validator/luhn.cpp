// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "log.hpp"
#include "validator/digit_view.hpp"
#include "validator/luhn.hpp"

namespace olval {

bool validate_luhn(std::string_view str) noexcept
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    const digit_view digits{str};

    const auto count = digits.count();
    if (count < luhn_min_digits || count > luhn_max_digits) {
        OLVAL_TRACE("Luhn candidate rejected, {} digits outside [{}, {}]", count,
            luhn_min_digits, luhn_max_digits);
        return false;
    }

    uint32_t sum = 0;
    bool should_double = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        const auto d = *it;
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }

    if (sum % 10U != 0U) {
        OLVAL_TRACE("Luhn candidate rejected, checksum {} not a multiple of 10", sum);
        return false;
    }

    return true;
}

} // namespace olval
