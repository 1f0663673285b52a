// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <ostream>
#include <string>
#include <string_view>

std::string read_file(std::string_view filename);

namespace term {

enum class colour : unsigned {
    red = 31,
    green = 32,
    yellow = 33,
    blue = 34,
    magenta = 35,
    cyan = 36,
    white = 37,
    off = 39,
};

bool has_colour();
} // namespace term

std::ostream &operator<<(std::ostream &os, term::colour c);
