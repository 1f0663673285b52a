// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <stdexcept>

#include "validator/validator_type.hpp"

#include "common/gtest_utils.hpp"

using namespace olval;

namespace {

TEST(TestValidatorType, FromString)
{
    EXPECT_EQ(validator_type_from_string("luhn"), validator_type::luhn);
    EXPECT_EQ(validator_type_from_string("ssn_format"), validator_type::ssn_format);
}

TEST(TestValidatorType, FromInvalidString)
{
    EXPECT_THROW(validator_type_from_string(""), std::invalid_argument);
    EXPECT_THROW(validator_type_from_string("LUHN"), std::invalid_argument);
    EXPECT_THROW(validator_type_from_string("ssn"), std::invalid_argument);
    EXPECT_THROW(validator_type_from_string("iban"), std::invalid_argument);
}

TEST(TestValidatorType, ToString)
{
    EXPECT_STR(validator_type_to_string(validator_type::luhn), "luhn");
    EXPECT_STR(validator_type_to_string(validator_type::ssn_format), "ssn_format");

    for (auto type : {validator_type::luhn, validator_type::ssn_format}) {
        EXPECT_EQ(validator_type_from_string(validator_type_to_string(type)), type);
    }
}

TEST(TestValidatorType, Dispatch)
{
    EXPECT_TRUE(validate(validator_type::luhn, "4111 1111 1111 1111"));
    EXPECT_FALSE(validate(validator_type::luhn, "123-45-6789"));

    EXPECT_TRUE(validate(validator_type::ssn_format, "123-45-6789"));
    EXPECT_FALSE(validate(validator_type::ssn_format, "4111 1111 1111 1111"));
}

TEST(TestValidatorType, DispatchOutOfRange)
{
    EXPECT_FALSE(validate(static_cast<validator_type>(42), "4111111111111111"));
}

} // namespace
