// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <string_view>
#include <vector>

#include "validator/digit_view.hpp"

#include "common/gtest_utils.hpp"

using namespace olval;
using namespace std::literals;

namespace {

std::vector<uint8_t> forward(std::string_view str)
{
    const digit_view view{str};
    return {view.begin(), view.end()};
}

std::vector<uint8_t> backward(std::string_view str)
{
    std::vector<uint8_t> values;
    const digit_view view{str};
    for (auto it = view.rbegin(); it != view.rend(); ++it) { values.emplace_back(*it); }
    return values;
}

TEST(TestDigitView, OnlyDigits)
{
    EXPECT_THAT(forward("0123456789"), ::testing::ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8, 9));
    EXPECT_EQ(digit_view{"0123456789"}.count(), 10U);
}

TEST(TestDigitView, SkipsSeparators)
{
    EXPECT_THAT(forward("12-3 4_5"), ::testing::ElementsAre(1, 2, 3, 4, 5));
    EXPECT_THAT(forward("--1--"), ::testing::ElementsAre(1));
    EXPECT_THAT(forward("a1b2c3d"), ::testing::ElementsAre(1, 2, 3));
    EXPECT_EQ(digit_view{" 4111-1111 "}.count(), 8U);
}

TEST(TestDigitView, Reverse)
{
    EXPECT_THAT(backward("12-3 4_5"), ::testing::ElementsAre(5, 4, 3, 2, 1));
    EXPECT_THAT(backward("9"), ::testing::ElementsAre(9));
    EXPECT_THAT(backward("x9y"), ::testing::ElementsAre(9));
    EXPECT_TRUE(backward("").empty());
    EXPECT_TRUE(backward("----").empty());
}

TEST(TestDigitView, NoDigits)
{
    EXPECT_TRUE(digit_view{""}.empty());
    EXPECT_TRUE(digit_view{"abcd"}.empty());
    EXPECT_TRUE(digit_view{"   "}.empty());
    EXPECT_EQ(digit_view{"abcd"}.count(), 0U);
    EXPECT_TRUE(forward("- _ /").empty());
}

TEST(TestDigitView, NonAsciiBytesAreNotDigits)
{
    // Fullwidth digits one, two and three in UTF-8
    EXPECT_TRUE(forward("\xef\xbc\x91\xef\xbc\x92\xef\xbc\x93").empty());
    EXPECT_THAT(forward("\xef\xbc\x91" "7"), ::testing::ElementsAre(7));

    // Bytes which would look like digits if sign-extended
    EXPECT_TRUE(forward("\xb0\xb1\xb9").empty());
}

TEST(TestDigitView, EmbeddedNul)
{
    EXPECT_THAT(forward("1\0" "2"sv), ::testing::ElementsAre(1, 2));
    EXPECT_EQ(digit_view{"\0\0\0"sv}.count(), 0U);
}

TEST(TestDigitView, Restartable)
{
    const digit_view view{"4-2"};
    const std::vector<uint8_t> first{view.begin(), view.end()};
    const std::vector<uint8_t> second{view.begin(), view.end()};
    EXPECT_EQ(first, second);
    EXPECT_EQ(view.count(), 2U);
    EXPECT_EQ(view.count(), 2U);
}

TEST(TestDigitView, PostIncrement)
{
    const digit_view view{"1 2"};
    auto it = view.begin();
    EXPECT_EQ(*it++, 1);
    EXPECT_EQ(*it, 2);
    ++it;
    EXPECT_TRUE(it == view.end());
}

} // namespace
