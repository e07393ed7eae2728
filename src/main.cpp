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
 * @file main.cpp
 * @brief Command line front end.
 *
 * @details
 * This file contains the `main` function which orchestrates one invocation:
 * 1. Global option extraction (`--help`, `--log-level`).
 * 2. Command dispatch (`validate` or `generate`).
 * 3. Output rendering (plain text, JSON or table).
 *
 * Exit status: 0 success, 1 at least one invalid number or an internal
 * failure, 2 usage error.
 */

#include "swepin/core/formatter.hpp"
#include "swepin/core/generator.hpp"
#include "swepin/core/parser.hpp"
#include "swepin/infra/logger.hpp"
#include "swepin/infra/string.hpp"
#include "swepin/view/labels.hpp"
#include "swepin/view/pretty.hpp"
#include "swepin/view/projection.hpp"

#include <cJSON.h>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using swepin::infra::Logger;
using swepin::infra::LogLevel;

namespace {

constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout
        << "Usage: " << binary_name << " [--log-level LEVEL] <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  validate [PIN ...]      Validate numbers from the arguments, or one per line on stdin\n"
        << "    --strict              Accept only YYYYMMDD-NNNN\n"
        << "    --today YYYY-MM-DD    Reference date (Default: today)\n"
        << "    --format FMT          plain | json | pretty (Default: plain)\n"
        << "    --lang LANG           eng | swe (Default: eng)\n"
        << "\n"
        << "  generate                Print random valid numbers\n"
        << "    --count N             How many (Default: 10)\n"
        << "    --start-year Y        Earliest birth year (Default: 1920)\n"
        << "    --end-year Y          Latest birth year (Default: reference year)\n"
        << "    --male-ratio R        Share of odd gender digits, 0-1 (Default: 0.5)\n"
        << "    --coordination-ratio R  Share of coordination numbers, 0-1 (Default: 0.1)\n"
        << "    --no-coordination     Never produce coordination numbers\n"
        << "    --no-centenarians     Only holders younger than 100\n"
        << "    --seed S              Reproducible output\n"
        << "    --today YYYY-MM-DD    Reference date (Default: today)\n"
        << "    --layout L            long | long-sep | short | short-sep (Default: short-sep)\n"
        << "    --format FMT          plain | json (Default: plain)\n"
        << "    --lang LANG           eng | swe (Default: eng)\n"
        << "\n"
        << "Global options:\n"
        << "  --log-level LEVEL       trace | debug | info | warn | error | fatal (Default: warn)\n"
        << "  --help                  Show this help message\n";
}

/// @brief Returns the argument after `args[i]`, advancing `i`.
const std::string& take_value(const std::vector<std::string>& args, std::size_t& i)
{
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Option " + args[i] + " requires a value");
    }
    return args[++i];
}

long long to_integer(const std::string& flag, const std::string& text)
{
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::invalid_argument("Option " + flag + " expects an integer, got '" + text + "'");
    }
    return value;
}

double to_ratio(const std::string& flag, const std::string& text)
{
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::invalid_argument("Option " + flag + " expects a number, got '" + text + "'");
    }
    return value;
}

swepin::core::Date to_date(const std::string& flag, const std::string& text)
{
    auto date = swepin::core::Date::from_iso(text);
    if (!date) {
        throw std::invalid_argument("Option " + flag + " expects YYYY-MM-DD, got '" + text + "'");
    }
    return *date;
}

swepin::view::Language to_language(const std::string& flag, const std::string& text)
{
    auto language = swepin::view::parse_language(text);
    if (!language) {
        throw std::invalid_argument("Option " + flag + " expects eng or swe, got '" + text + "'");
    }
    return *language;
}

std::string error_json(const std::string& input, const swepin::core::ParseError& error)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "input", input.c_str());
    cJSON_AddStringToObject(root, "error", swepin::core::to_string(error.kind).c_str());
    cJSON_AddStringToObject(root, "field", error.field.c_str());
    cJSON_AddStringToObject(root, "message", error.message().c_str());

    char* raw = cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (!raw) {
        throw std::runtime_error("CLI: cJSON failed to serialize error report");
    }
    std::string out(raw);
    free(raw);
    return out;
}

/**
 * @brief `validate` command.
 *
 * @return 0 if every input is valid, 1 otherwise.
 */
int run_validate(const std::vector<std::string>& args)
{
    bool strict = false;
    swepin::core::Date today = swepin::core::Date::today();
    std::string format = "plain";
    swepin::view::Language language = swepin::view::Language::ENG;
    std::vector<std::string> inputs;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--strict") {
            strict = true;
        } else if (arg == "--today") {
            today = to_date(arg, take_value(args, i));
        } else if (arg == "--format") {
            format = take_value(args, i);
            if (format != "plain" && format != "json" && format != "pretty") {
                throw std::invalid_argument("Option --format expects plain, json or pretty");
            }
        } else if (arg == "--lang") {
            language = to_language(arg, take_value(args, i));
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw std::invalid_argument("Unknown validate option: " + arg);
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.empty()) {
        Logger::log(LogLevel::DEBUG, "CLI: reading identity numbers from stdin");
        std::string line;
        while (std::getline(std::cin, line)) {
            std::string clean = swepin::infra::String::trim(line);
            if (!clean.empty()) {
                inputs.push_back(clean);
            }
        }
    }

    int invalid = 0;
    for (const auto& input : inputs) {
        auto result = strict ? swepin::core::Parser::parse_strict(input, today)
                             : swepin::core::Parser::parse(input, today);
        if (!result) {
            invalid++;
            if (format == "json") {
                std::cout << error_json(input, result.error()) << "\n";
            } else {
                std::cout << input << "\tINVALID\t" << result.error().message() << "\n";
            }
            continue;
        }

        const auto& pin = result.value();
        if (format == "json") {
            std::cout << swepin::view::Projection::to_json(pin, language, today) << "\n";
        } else if (format == "pretty") {
            std::cout << swepin::view::PrettyPrinter::render(pin, language, today) << "\n";
        } else {
            std::cout << input << "\tOK\t"
                      << swepin::core::Formatter::long_form_with_separator(pin) << "\n";
        }
    }

    Logger::log(LogLevel::INFO, "CLI: validated " + std::to_string(inputs.size()) +
                                    " number(s), " + std::to_string(invalid) + " invalid");
    return invalid == 0 ? 0 : EXIT_INVALID;
}

/**
 * @brief `generate` command.
 */
int run_generate(const std::vector<std::string>& args)
{
    swepin::core::GeneratorOptions options;
    std::optional<std::uint64_t> seed;
    swepin::core::PinFormat layout = swepin::core::PinFormat::SHORT_WITH_SEPARATOR;
    std::string format = "plain";
    swepin::view::Language language = swepin::view::Language::ENG;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--count") {
            long long count = to_integer(arg, take_value(args, i));
            if (count < 0) {
                throw std::invalid_argument("Option --count must not be negative");
            }
            options.count = static_cast<std::size_t>(count);
        } else if (arg == "--start-year") {
            options.start_year = static_cast<int>(to_integer(arg, take_value(args, i)));
        } else if (arg == "--end-year") {
            options.end_year = static_cast<int>(to_integer(arg, take_value(args, i)));
        } else if (arg == "--male-ratio") {
            options.male_ratio = to_ratio(arg, take_value(args, i));
        } else if (arg == "--coordination-ratio") {
            options.coordination_ratio = to_ratio(arg, take_value(args, i));
        } else if (arg == "--no-coordination") {
            options.include_coordination_numbers = false;
        } else if (arg == "--no-centenarians") {
            options.include_centenarians = false;
        } else if (arg == "--seed") {
            seed = static_cast<std::uint64_t>(to_integer(arg, take_value(args, i)));
        } else if (arg == "--today") {
            options.reference_date = to_date(arg, take_value(args, i));
        } else if (arg == "--layout") {
            const std::string& value = take_value(args, i);
            if (value == "long") {
                layout = swepin::core::PinFormat::LONG_WITHOUT_SEPARATOR;
            } else if (value == "long-sep") {
                layout = swepin::core::PinFormat::LONG_WITH_SEPARATOR;
            } else if (value == "short") {
                layout = swepin::core::PinFormat::SHORT_WITHOUT_SEPARATOR;
            } else if (value == "short-sep") {
                layout = swepin::core::PinFormat::SHORT_WITH_SEPARATOR;
            } else {
                throw std::invalid_argument("Option --layout expects long, long-sep, short or "
                                            "short-sep");
            }
        } else if (arg == "--format") {
            format = take_value(args, i);
            if (format != "plain" && format != "json") {
                throw std::invalid_argument("Option --format expects plain or json");
            }
        } else if (arg == "--lang") {
            language = to_language(arg, take_value(args, i));
        } else {
            throw std::invalid_argument("Unknown generate option: " + arg);
        }
    }

    // Pin the reference date once so that every number and its age agree.
    swepin::core::Date today = options.reference_date.value_or(swepin::core::Date::today());
    options.reference_date = today;

    swepin::core::Generator generator = seed ? swepin::core::Generator(*seed)
                                             : swepin::core::Generator();
    auto pins = generator.generate(options);

    for (const auto& pin : pins) {
        if (format == "json") {
            std::cout << swepin::view::Projection::to_json(pin, language, today) << "\n";
        } else {
            std::cout << swepin::core::Formatter::format(pin, layout) << "\n";
        }
    }

    Logger::log(LogLevel::INFO, "CLI: generated " + std::to_string(pins.size()) + " number(s)");
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // Diagnostics stay quiet unless asked for; results go to stdout.
    Logger::set_level(LogLevel::WARN);

    std::vector<std::string> args;
    std::string command;

    try {
        // 1. Global options and command word
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_help(argv[0]);
                return 0;
            }
            if (arg == "--log-level") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Option --log-level requires a value");
                }
                auto level = Logger::parse_level(argv[++i]);
                if (!level) {
                    throw std::invalid_argument("Unknown log level: " + std::string(argv[i]));
                }
                Logger::set_level(*level);
            } else if (command.empty()) {
                command = arg;
            } else {
                args.push_back(arg);
            }
        }

        // 2. Dispatch
        if (command == "validate") {
            return run_validate(args);
        }
        if (command == "generate") {
            return run_generate(args);
        }
        if (command.empty()) {
            throw std::invalid_argument("Missing command");
        }
        throw std::invalid_argument("Unknown command: " + command);

    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::ERROR, "Usage: " + std::string(e.what()));
        print_help(argv[0]);
        return EXIT_USAGE;
    } catch (const swepin::core::GeneratorInvariantError& e) {
        Logger::log(LogLevel::FATAL, "Generator invariant violated: " + std::string(e.what()));
        return EXIT_INVALID;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return EXIT_INVALID;
    }
}
