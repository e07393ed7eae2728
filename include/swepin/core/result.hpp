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
 * @file result.hpp
 * @brief Tagged "value or ParseError" return type used by every pipeline stage.
 */

#pragma once

#include "swepin/core/errors.hpp"

#include <utility>
#include <variant>

namespace swepin::core {

/**
 * @class Result
 * @brief Holds either a successfully computed `T` or the `ParseError` that stopped it.
 *
 * @details
 * Accessing the wrong alternative throws `std::bad_variant_access`; callers are
 * expected to test `ok()` first.
 *
 * @code
 * auto result = Parser::parse("811218-9876");
 * if (!result) {
 *     std::cerr << result.error().message() << '\n';
 * }
 * @endcode
 */
template <typename T> class Result {
  public:
    Result(T value) : data_(std::move(value)) {}
    Result(ParseError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    const ParseError& error() const { return std::get<ParseError>(data_); }

  private:
    std::variant<T, ParseError> data_;
};

} // namespace swepin::core
