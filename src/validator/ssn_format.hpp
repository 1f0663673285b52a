// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

namespace olval {

// area (3) + group (2) + serial (4)
constexpr std::size_t ssn_digits = 9;

// Validates the format of a 9-digit national identifier candidate, non-digit
// characters are ignored. Only the structure is checked, not issuance.
[[nodiscard]] bool validate_ssn_format(std::string_view str) noexcept;

} // namespace olval
