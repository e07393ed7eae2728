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
 * @file errors.cpp
 * @brief Rendering of parse errors.
 */

#include "swepin/core/errors.hpp"

namespace swepin::core {

std::string to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::FORMAT:
        return "FormatError";
    case ErrorKind::CENTURY_AMBIGUITY:
        return "CenturyAmbiguityError";
    case ErrorKind::INVALID_DATE:
        return "InvalidDateError";
    case ErrorKind::CHECKSUM:
        return "ChecksumError";
    }
    return "UnknownError";
}

std::string ParseError::message() const
{
    std::string detail;
    switch (kind) {
    case ErrorKind::FORMAT:
        detail = "malformed " + field;
        break;
    case ErrorKind::CENTURY_AMBIGUITY:
        detail = "cannot resolve century from " + field;
        break;
    case ErrorKind::INVALID_DATE:
        detail = "invalid " + field;
        break;
    case ErrorKind::CHECKSUM:
        detail = field + " mismatch";
        break;
    }
    return to_string(kind) + ": " + detail + " (expected " + expected + ", got " + actual + ")";
}

} // namespace swepin::core
