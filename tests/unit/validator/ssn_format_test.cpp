// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "validator/ssn_format.hpp"

#include "common/gtest_utils.hpp"

using namespace olval;
using namespace std::literals;

namespace {

TEST(TestSSNFormat, Valid)
{
    EXPECT_TRUE(validate_ssn_format("123-45-6789"));
    EXPECT_TRUE(validate_ssn_format("123456789"));
    EXPECT_TRUE(validate_ssn_format("123 45 6789"));
    EXPECT_TRUE(validate_ssn_format("123 - 45 - 6789"));
    EXPECT_TRUE(validate_ssn_format("  123-45-6789  "));
    EXPECT_TRUE(validate_ssn_format("123.45.6789"));
    EXPECT_TRUE(validate_ssn_format("001-01-0001"));
}

TEST(TestSSNFormat, InvalidArea)
{
    EXPECT_FALSE(validate_ssn_format("000-45-6789"));
    EXPECT_FALSE(validate_ssn_format("666-45-6789"));
    EXPECT_FALSE(validate_ssn_format("900-45-6789"));
    EXPECT_FALSE(validate_ssn_format("999-45-6789"));
    EXPECT_FALSE(validate_ssn_format("950456789"));
}

TEST(TestSSNFormat, InvalidGroup)
{
    EXPECT_FALSE(validate_ssn_format("123-00-6789"));
    EXPECT_FALSE(validate_ssn_format("123006789"));
}

TEST(TestSSNFormat, InvalidSerial)
{
    EXPECT_FALSE(validate_ssn_format("123-45-0000"));
    EXPECT_FALSE(validate_ssn_format("123450000"));
    EXPECT_TRUE(validate_ssn_format("123-45-0001"));
    EXPECT_TRUE(validate_ssn_format("123-45-1000"));
}

TEST(TestSSNFormat, InvalidLength)
{
    EXPECT_FALSE(validate_ssn_format("12345678"));
    EXPECT_FALSE(validate_ssn_format("1234567890"));
    EXPECT_FALSE(validate_ssn_format("12-34-5678"));
    EXPECT_FALSE(validate_ssn_format("1234-56-7890"));
    EXPECT_FALSE(validate_ssn_format("123-45-678"));
    EXPECT_FALSE(validate_ssn_format(""));
    EXPECT_FALSE(validate_ssn_format("abc-de-fghi"));
    EXPECT_FALSE(validate_ssn_format("---------"));
}

TEST(TestSSNFormat, FullwidthDigitsAreIgnored)
{
    // Fullwidth "123" leaves only six ASCII digits
    EXPECT_FALSE(validate_ssn_format("\xef\xbc\x91\xef\xbc\x92\xef\xbc\x93-45-6789"));
}

TEST(TestSSNFormat, AreaBoundaries)
{
    EXPECT_TRUE(validate_ssn_format("001-45-6789"));
    EXPECT_TRUE(validate_ssn_format("665-45-6789"));
    EXPECT_TRUE(validate_ssn_format("667-45-6789"));
    EXPECT_TRUE(validate_ssn_format("899-45-6789"));

    EXPECT_FALSE(validate_ssn_format("000-45-6789"));
    EXPECT_FALSE(validate_ssn_format("666-45-6789"));
    EXPECT_FALSE(validate_ssn_format("900-45-6789"));
}

TEST(TestSSNFormat, AllAreas)
{
    for (unsigned area = 0; area < 1000; ++area) {
        const bool expected = area != 0 && area != 666 && area < 900;
        auto ssn = fmt::format("{:03}-45-6789", area);
        EXPECT_EQ(validate_ssn_format(ssn), expected) << ssn;
    }
}

TEST(TestSSNFormat, AllGroups)
{
    for (unsigned group = 0; group < 100; ++group) {
        auto ssn = fmt::format("123-{:02}-6789", group);
        EXPECT_EQ(validate_ssn_format(ssn), group != 0) << ssn;
    }
}

TEST(TestSSNFormat, PunctuationInvariance)
{
    std::mt19937 rng{7};
    std::uniform_int_distribution<int> choice(0, 3);

    for (const auto *digits : {"123456789", "666456789", "123006789", "123450000", "12345678"}) {
        const bool expected = validate_ssn_format(digits);
        for (int i = 0; i < 64; ++i) {
            std::string formatted;
            for (const auto *c = digits; *c != '\0'; ++c) {
                switch (choice(rng)) {
                case 0:
                    formatted.push_back('-');
                    break;
                case 1:
                    formatted.push_back(' ');
                    break;
                case 2:
                    formatted.append("x/");
                    break;
                default:
                    break;
                }
                formatted.push_back(*c);
            }
            EXPECT_EQ(validate_ssn_format(formatted), expected) << formatted;
        }
    }
}

TEST(TestSSNFormat, Totality)
{
    std::mt19937 rng{31337};
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::uniform_int_distribution<std::size_t> size_dist(0, 32);

    for (int i = 0; i < 4096; ++i) {
        std::string input(size_dist(rng), '\0');
        for (auto &c : input) { c = static_cast<char>(byte_dist(rng)); }

        const bool first = validate_ssn_format(input);
        EXPECT_EQ(validate_ssn_format(input), first);
    }

    const std::string long_input(1U << 20, '5');
    EXPECT_FALSE(validate_ssn_format(long_input));
    EXPECT_FALSE(validate_ssn_format("\0\0\0\0\0\0\0\0\0"sv));
    EXPECT_TRUE(validate_ssn_format("1\0" "23\0" "45\0" "6789"sv));
}

TEST(TestSSNFormat, Concurrent)
{
    const std::vector<std::pair<std::string, bool>> samples{{"123-45-6789", true},
        {"666-45-6789", false}, {"899 45 6789", true}, {"123-45-0000", false},
        {"12345678", false}};

    std::vector<std::thread> threads;
    std::vector<unsigned> mismatches(8, 0);
    threads.reserve(mismatches.size());
    for (auto &count : mismatches) {
        threads.emplace_back([&samples, &count]() {
            for (int i = 0; i < 10000; ++i) {
                for (const auto &[input, expected] : samples) {
                    count += validate_ssn_format(input) == expected ? 0 : 1;
                }
            }
        });
    }

    for (auto &thread : threads) { thread.join(); }
    for (auto count : mismatches) { EXPECT_EQ(count, 0); }
}

} // namespace
