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
 * @file main_test.cpp
 * @brief Central orchestrator for the swepin test suite.
 *
 * @details
 * Aggregates the unit tests of every subsystem: Infrastructure, Check Digit,
 * Calendar, Parser, Generator and Presentation.
 */

#include "framework.hpp"

#include "swepin/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, parser_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_digits();
void test_string_display_width();
void test_random_thread_confinement();
void test_logger_levels();

// Check Digit (checksum_test.cpp)
void test_checksum_known_values();
void test_checksum_verify();
void test_checksum_totality();
void test_checksum_detects_single_digit_errors();
void test_checksum_rejects_malformed_input();

// Calendar (calendar_test.cpp)
void test_date_leap_years();
void test_date_day_ordinals();
void test_date_iso();
void test_date_age();
void test_calendar_coordination_days();
void test_calendar_range_dead_zones();
void test_calendar_validate();

// Parser (parser_test.cpp)
void test_normalizer_layouts();
void test_normalizer_format_errors();
void test_parse_long_form();
void test_parse_short_form();
void test_parse_coordination_number();
void test_parse_leap_days();
void test_parse_checksum_errors();
void test_parse_invalid_dates();
void test_century_from_separator();
void test_century_future_candidates();
void test_century_boundary();
void test_century_long_forms();
void test_century_depends_only_on_reference();
void test_parse_strict();
void test_format_reproduces_input();
void test_format_all_layouts();

// Generator (generator_test.cpp)
void test_generator_output_always_valid();
void test_generator_seeded_determinism();
void test_generator_rejects_invalid_options();
void test_generator_without_centenarians();
void test_generator_ratios();
void test_generator_year_window();
void test_generator_concurrent_use();

// Presentation (view_test.cpp)
void test_labels_language_names();
void test_projection_map_english();
void test_projection_map_swedish();
void test_projection_json();
void test_projection_json_swedish();
void test_pretty_printer_layout();
void test_pretty_printer_content();
void test_birth_place_counties();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating swepin Test Suite...\033[0m" << std::endl;

    // Rejections are logged at DEBUG; keep the report readable.
    swepin::infra::Logger::set_level(swepin::infra::LogLevel::WARN);

    // --- 1. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_digits);
    RUN_TEST(test_string_display_width);
    RUN_TEST(test_random_thread_confinement);
    RUN_TEST(test_logger_levels);

    // --- 2. Check Digit ---
    RUN_TEST(test_checksum_known_values);
    RUN_TEST(test_checksum_verify);
    RUN_TEST(test_checksum_totality);
    RUN_TEST(test_checksum_detects_single_digit_errors);
    RUN_TEST(test_checksum_rejects_malformed_input);

    // --- 3. Calendar ---
    RUN_TEST(test_date_leap_years);
    RUN_TEST(test_date_day_ordinals);
    RUN_TEST(test_date_iso);
    RUN_TEST(test_date_age);
    RUN_TEST(test_calendar_coordination_days);
    RUN_TEST(test_calendar_range_dead_zones);
    RUN_TEST(test_calendar_validate);

    // --- 4. Parser ---
    // Normalization, century inference and the four layouts.
    RUN_TEST(test_normalizer_layouts);
    RUN_TEST(test_normalizer_format_errors);
    RUN_TEST(test_parse_long_form);
    RUN_TEST(test_parse_short_form);
    RUN_TEST(test_parse_coordination_number);
    RUN_TEST(test_parse_leap_days);
    RUN_TEST(test_parse_checksum_errors);
    RUN_TEST(test_parse_invalid_dates);
    RUN_TEST(test_century_from_separator);
    RUN_TEST(test_century_future_candidates);
    RUN_TEST(test_century_boundary);
    RUN_TEST(test_century_long_forms);
    RUN_TEST(test_century_depends_only_on_reference);
    RUN_TEST(test_parse_strict);
    RUN_TEST(test_format_reproduces_input);
    RUN_TEST(test_format_all_layouts);

    // --- 5. Generator ---
    RUN_TEST(test_generator_output_always_valid);
    RUN_TEST(test_generator_seeded_determinism);
    RUN_TEST(test_generator_rejects_invalid_options);
    RUN_TEST(test_generator_without_centenarians);
    RUN_TEST(test_generator_ratios);
    RUN_TEST(test_generator_year_window);
    RUN_TEST(test_generator_concurrent_use);

    // --- 6. Presentation ---
    RUN_TEST(test_labels_language_names);
    RUN_TEST(test_projection_map_english);
    RUN_TEST(test_projection_map_swedish);
    RUN_TEST(test_projection_json);
    RUN_TEST(test_projection_json_swedish);
    RUN_TEST(test_pretty_printer_layout);
    RUN_TEST(test_pretty_printer_content);
    RUN_TEST(test_birth_place_counties);

    swepin::test::print_summary();

    return (swepin::test::failed_count == 0) ? 0 : 1;
}
