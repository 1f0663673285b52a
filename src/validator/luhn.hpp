// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

namespace olval {

// Payment card numbers carry between 13 and 19 digits
constexpr std::size_t luhn_min_digits = 13;
constexpr std::size_t luhn_max_digits = 19;

// Validates a payment card candidate, non-digit characters are ignored.
[[nodiscard]] bool validate_luhn(std::string_view str) noexcept;

} // namespace olval
