// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <string_view>

#include "log.hpp"
#include "utils.hpp"
#include "validator/digit_view.hpp"
#include "validator/ssn_format.hpp"

namespace olval {

namespace {

constexpr std::size_t area_width = 3;
constexpr std::size_t group_width = 2;
constexpr std::size_t serial_width = 4;

static_assert(area_width + group_width + serial_width == ssn_digits);

constexpr unsigned reserved_area = 666;
constexpr unsigned first_unassigned_area = 900;

} // namespace

bool validate_ssn_format(std::string_view str) noexcept
{
    const digit_view digits{str};
    if (digits.count() != ssn_digits) {
        OLVAL_TRACE("SSN candidate rejected, expected {} digits", ssn_digits);
        return false;
    }

    std::array<char, ssn_digits> buffer{};
    std::size_t i = 0;
    for (auto d : digits) { buffer[i++] = static_cast<char>('0' + d); }

    const std::string_view normalised{buffer.data(), buffer.size()};
    auto [area_ok, area] = from_string<unsigned>(normalised.substr(0, area_width));
    auto [group_ok, group] = from_string<unsigned>(normalised.substr(area_width, group_width));
    auto [serial_ok, serial] =
        from_string<unsigned>(normalised.substr(area_width + group_width, serial_width));
    if (!area_ok || !group_ok || !serial_ok) {
        return false;
    }

    if (area == 0 || area == reserved_area || area >= first_unassigned_area) {
        OLVAL_TRACE("SSN candidate rejected, invalid area {:03}", area);
        return false;
    }

    if (group == 0 || serial == 0) {
        OLVAL_TRACE("SSN candidate rejected, group {:02} serial {:04}", group, serial);
        return false;
    }

    return true;
}

} // namespace olval
