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
 * @file normalizer.cpp
 * @brief Implementation of the structural input checks.
 */

#include "swepin/core/normalizer.hpp"

#include <cctype>

namespace swepin::core {

std::string to_string(PinFormat format)
{
    switch (format) {
    case PinFormat::LONG_WITHOUT_SEPARATOR:
        return "YYYYMMDDNNNN";
    case PinFormat::LONG_WITH_SEPARATOR:
        return "YYYYMMDD-NNNN";
    case PinFormat::SHORT_WITH_SEPARATOR:
        return "YYMMDD-NNNN";
    case PinFormat::SHORT_WITHOUT_SEPARATOR:
        return "YYMMDDNNNN";
    }
    return "";
}

/**
 * @brief Single left-to-right scan over the input.
 *
 * The separator position is remembered as an index into the raw string so
 * that "immediately before the final four digits" can be checked once the
 * total length is known.
 */
Result<NormalizedInput> Normalizer::normalize(std::string_view input)
{
    NormalizedInput out;
    out.digits.reserve(12);
    std::size_t separator_pos = std::string_view::npos;

    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            out.digits.push_back(c);
            continue;
        }
        if (c == '-' || c == '+') {
            if (out.separator) {
                return ParseError{ErrorKind::FORMAT, "separator", "at most one '-' or '+'",
                                  "'" + std::string(input) + "'"};
            }
            out.separator = c;
            separator_pos = i;
            continue;
        }
        return ParseError{ErrorKind::FORMAT, "character", "digits, '-' or '+'",
                          "'" + std::string(1, c) + "' at position " + std::to_string(i + 1)};
    }

    if (out.digits.size() != 10 && out.digits.size() != 12) {
        return ParseError{ErrorKind::FORMAT, "length", "10 or 12 digits",
                          std::to_string(out.digits.size()) + " digits"};
    }

    if (out.separator && separator_pos + 5 != input.size()) {
        return ParseError{ErrorKind::FORMAT, "separator position",
                          "separator before the final four digits",
                          "separator at position " + std::to_string(separator_pos + 1)};
    }

    if (out.has_century()) {
        out.format = out.separator ? PinFormat::LONG_WITH_SEPARATOR
                                   : PinFormat::LONG_WITHOUT_SEPARATOR;
    } else {
        out.format = out.separator ? PinFormat::SHORT_WITH_SEPARATOR
                                   : PinFormat::SHORT_WITHOUT_SEPARATOR;
    }
    return out;
}

bool Normalizer::matches(std::string_view input, PinFormat format)
{
    auto result = normalize(input);
    return result && result.value().format == format;
}

} // namespace swepin::core
