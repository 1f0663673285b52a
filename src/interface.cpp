// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include "log.hpp"
#include "olval.h"
#include "validator/luhn.hpp"
#include "validator/ssn_format.hpp"
#include "validator/validator_type.hpp"
#include "version.hpp"

using namespace olval;

static_assert(static_cast<uint8_t>(validator_type::luhn) + 1 == OLVAL_VALIDATOR_LUHN);
static_assert(static_cast<uint8_t>(validator_type::ssn_format) + 1 == OLVAL_VALIDATOR_SSN_FORMAT);

namespace {

OLVAL_VALIDATOR to_c_validator(validator_type type)
{
    return static_cast<OLVAL_VALIDATOR>(static_cast<uint8_t>(type) + 1);
}

} // namespace

extern "C" {

bool olval_validate_luhn(const char *str, size_t length)
{
    if (str == nullptr) {
        OLVAL_DEBUG("Tried to validate a null candidate");
        return false;
    }

    return validate_luhn({str, length});
}

bool olval_validate_ssn_format(const char *str, size_t length)
{
    if (str == nullptr) {
        OLVAL_DEBUG("Tried to validate a null candidate");
        return false;
    }

    return validate_ssn_format({str, length});
}

bool olval_validate(OLVAL_VALIDATOR validator, const char *str, size_t length)
{
    if (str == nullptr) {
        OLVAL_DEBUG("Tried to validate a null candidate");
        return false;
    }

    switch (validator) {
    case OLVAL_VALIDATOR_LUHN:
        return validate(validator_type::luhn, {str, length});
    case OLVAL_VALIDATOR_SSN_FORMAT:
        return validate(validator_type::ssn_format, {str, length});
    case OLVAL_VALIDATOR_INVALID:
    default:
        break;
    }

    OLVAL_DEBUG("Unknown validator {}", static_cast<int>(validator));
    return false;
}

OLVAL_VALIDATOR olval_validator_from_string(const char *name, size_t length)
{
    if (name == nullptr) {
        return OLVAL_VALIDATOR_INVALID;
    }

    try {
        return to_c_validator(validator_type_from_string({name, length}));
    } catch (const std::exception &e) {
        OLVAL_ERROR("{}: '{}'", e.what(), std::string_view(name, length));
    }

    return OLVAL_VALIDATOR_INVALID;
}

bool olval_is_available() { return true; }

const char *olval_get_version() { return current_version.data(); }

bool olval_set_log_cb(olval_log_cb cb, OLVAL_LOG_LEVEL min_level)
{
    olval::logger::init(cb, static_cast<log_level>(min_level));
    OLVAL_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}

} // extern "C"
