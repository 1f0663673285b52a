// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace olval {

enum class validator_type : uint8_t { luhn, ssn_format };

// Throws std::invalid_argument on unknown names
validator_type validator_type_from_string(std::string_view str);
std::string_view validator_type_to_string(validator_type type);

bool validate(validator_type type, std::string_view str) noexcept;

} // namespace olval
