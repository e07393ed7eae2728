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
 * @file projection.hpp
 * @brief Map and JSON projections of a validated identity number.
 *
 * @details
 * Projections read a `Pin` and a reference date and never validate anything.
 * The JSON document mirrors this layout (English keys):
 *
 * @code
 * {
 *   "personal_identity_number": "811218-9876",
 *   "birth_date": { "century": "19", "year": "81", "full_year": "1981", "month": "12",
 *                   "day": "18", "iso_date": "1981-12-18" },
 *   "separator": "-",
 *   "birth_number": { "complete": "987", "birth_place": "98", "gender_digit": "7" },
 *   "validation_digit": "6",
 *   "derived_info": { "age": 44, "gender": "male", "is_coordination_number": false },
 *   "formats": { "long_format": "198112189876", ... }
 * }
 * @endcode
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/pin.hpp"
#include "swepin/view/labels.hpp"

#include <cJSON.h>
#include <map>
#include <string>

namespace swepin::view {

/**
 * @class Projection
 * @brief Static builders for key/value and JSON views.
 */
class Projection {
  public:
    /**
     * @brief Flat key/value view of every leaf field.
     *
     * `actual_day` is present only for coordination numbers. Booleans are
     * rendered as `"true"`/`"false"`.
     *
     * @param on The day the age is computed for.
     */
    static std::map<std::string, std::string> to_map(const core::Pin& pin, Language language,
                                                     const core::Date& on);

    /**
     * @brief Nested JSON object as a cJSON tree.
     *
     * @warning The caller assumes ownership of the returned `cJSON*` pointer
     * and must release it with `cJSON_Delete`.
     */
    static cJSON* to_cjson(const core::Pin& pin, Language language, const core::Date& on);

    /**
     * @brief Serialized form of `to_cjson()`.
     *
     * @param formatted Indented output when true, compact otherwise.
     */
    static std::string to_json(const core::Pin& pin, Language language, const core::Date& on,
                               bool formatted = false);
};

} // namespace swepin::view
