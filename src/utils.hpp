// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>
#include <utility>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace olval {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <typename T> std::pair<bool, T> from_string(std::string_view str);

} // namespace olval
