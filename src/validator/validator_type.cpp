// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <stdexcept>
#include <string_view>

#include "validator/luhn.hpp"
#include "validator/ssn_format.hpp"
#include "validator/validator_type.hpp"

namespace olval {

validator_type validator_type_from_string(std::string_view str)
{
    if (str == "luhn") {
        return validator_type::luhn;
    }

    if (str == "ssn_format") {
        return validator_type::ssn_format;
    }

    throw std::invalid_argument("unknown validator");
}

std::string_view validator_type_to_string(validator_type type)
{
    switch (type) {
    case validator_type::luhn:
        return "luhn";
    case validator_type::ssn_format:
        return "ssn_format";
    default:
        break;
    }
    return "unknown";
}

bool validate(validator_type type, std::string_view str) noexcept
{
    switch (type) {
    case validator_type::luhn:
        return validate_luhn(str);
    case validator_type::ssn_format:
        return validate_ssn_format(str);
    default:
        break;
    }
    return false;
}

} // namespace olval
