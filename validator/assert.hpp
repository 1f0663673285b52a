// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#define expect(lhs, rhs)                                                                           \
    try {                                                                                          \
        expect_equal(lhs, rhs, __LINE__, __func__);                                                \
    } catch (const assert_exception &e) {                                                          \
        throw;                                                                                     \
    } catch (const std::exception &e) {                                                            \
        throw assert_exception(e.what(), __LINE__, __func__);                                      \
    }

class assert_exception : public std::exception {
public:
    assert_exception(std::string_view what, int loc, std::string_view fn)
    {
        std::stringstream ss;
        ss << fn << "(" << loc << "): " << what;
        what_ = ss.str();
    }

    template <typename T>
    assert_exception(const T &lhs, const T &rhs, int loc, std::string_view fn)
    {
        std::stringstream ss;
        ss << std::boolalpha << fn << "(" << loc << "): " << lhs << " != " << rhs;
        what_ = ss.str();
    }
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

template <typename T>
inline void expect_equal(const T &lhs, const T &rhs, int loc, std::string_view fn)
{
    if (lhs != rhs) {
        throw assert_exception(lhs, rhs, loc, fn);
    }
}
