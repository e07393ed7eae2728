/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "swepin/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace swepin::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

bool String::is_digits(std::string_view s)
{
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

int String::to_int(std::string_view s)
{
    int value = 0;
    for (char c : s) {
        value = value * 10 + (c - '0');
    }
    return value;
}

std::string String::zero_pad(int value, std::size_t width)
{
    std::string digits = std::to_string(value);
    if (digits.size() >= width) {
        return digits;
    }
    return std::string(width - digits.size(), '0') + digits;
}

std::size_t String::display_width(std::string_view s)
{
    std::size_t width = 0;
    for (char c : s) {
        // UTF-8 continuation bytes have the bit pattern 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            width++;
        }
    }
    return width;
}

std::string String::pad_right(const std::string& s, std::size_t width)
{
    std::size_t used = display_width(s);
    if (used >= width) {
        return s;
    }
    return s + std::string(width - used, ' ');
}

std::string String::center(const std::string& s, std::size_t width)
{
    std::size_t used = display_width(s);
    if (used >= width) {
        return s;
    }
    std::size_t left = (width - used) / 2;
    std::size_t right = width - used - left;
    return std::string(left, ' ') + s + std::string(right, ' ');
}

std::string String::repeat(std::string_view glyph, std::size_t count)
{
    std::string out;
    out.reserve(glyph.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        out.append(glyph);
    }
    return out;
}

} // namespace swepin::infra
