// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>

#include "utils.hpp"

namespace olval {

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result{};
    const auto *end = str.data() + str.size();
    auto [endConv, err] = std::from_chars(str.data(), end, result);
    if (err == std::errc{} && endConv == end) {
        return {true, result};
    }

    return {false, {}};
}

template std::pair<bool, unsigned> from_string<unsigned>(std::string_view str);

} // namespace olval
