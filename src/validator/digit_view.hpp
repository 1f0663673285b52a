// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>

#include "utils.hpp"

namespace olval {

// Lazy view over the ASCII digits of a string, any other byte is skipped.
// Each digit is yielded as its numeric value, the underlying string must
// outlive the view and its iterators.
class digit_view {
public:
    template <bool Reverse> class basic_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = uint8_t;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = uint8_t;

        basic_iterator() = default;
        basic_iterator(std::string_view str, std::size_t pos) : str_(str), pos_(pos) { skip(); }

        uint8_t operator*() const noexcept { return static_cast<uint8_t>(current() - '0'); }

        basic_iterator &operator++() noexcept
        {
            advance();
            skip();
            return *this;
        }

        basic_iterator operator++(int) noexcept
        {
            auto copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const basic_iterator &other) const noexcept { return pos_ == other.pos_; }

    private:
        // Forward iterators point at the current character, reverse iterators
        // point one past it.
        [[nodiscard]] char current() const noexcept
        {
            if constexpr (Reverse) {
                return str_[pos_ - 1];
            } else {
                return str_[pos_];
            }
        }

        [[nodiscard]] bool at_end() const noexcept
        {
            if constexpr (Reverse) {
                return pos_ == 0;
            } else {
                return pos_ >= str_.size();
            }
        }

        void advance() noexcept
        {
            if constexpr (Reverse) {
                --pos_;
            } else {
                ++pos_;
            }
        }

        void skip() noexcept
        {
            while (!at_end() && !isdigit(current())) { advance(); }
        }

        std::string_view str_{};
        std::size_t pos_{0};
    };

    using iterator = basic_iterator<false>;
    using reverse_iterator = basic_iterator<true>;

    explicit digit_view(std::string_view str) noexcept : str_(str) {}

    [[nodiscard]] iterator begin() const noexcept { return {str_, 0}; }
    [[nodiscard]] iterator end() const noexcept { return {str_, str_.size()}; }
    [[nodiscard]] reverse_iterator rbegin() const noexcept { return {str_, str_.size()}; }
    [[nodiscard]] reverse_iterator rend() const noexcept { return {str_, 0}; }

    [[nodiscard]] std::size_t count() const noexcept
    {
        std::size_t total = 0;
        for (auto c : str_) { total += isdigit(c) ? 1 : 0; }
        return total;
    }

    [[nodiscard]] bool empty() const noexcept { return begin() == end(); }

private:
    std::string_view str_;
};

} // namespace olval
