// BSD 3-Clause License
//
// Copyright (c) 2021-2025, gpu_diagnostics_system contributors
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

/**
 * @file config_parser.h
 * @brief Type-safe parsing of flat string configuration maps
 *
 * Usage:
 * @code
 * using gpudiag::config_parser;
 *
 * config_map config = {{"status.critical", "60"}, {"snapshot.policy", "clamp"}};
 *
 * double critical = config_parser::get<double>(config, "status.critical", 60.0);
 * std::string policy = config_parser::get<std::string>(config, "snapshot.policy", "propagate");
 * @endcode
 *
 * A value is accepted only when the whole string parses; "12abc" is not 12.
 */

#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace gpudiag {

/**
 * @brief Type alias for configuration map
 */
using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Unified configuration parsing utility
 *
 * Handles boolean, integer, floating-point, and string types consistently.
 */
class config_parser {
   public:
    /**
     * @brief Get a configuration value with type conversion
     * @tparam T The target type (bool, int, double, std::string, ...)
     * @param config The configuration map
     * @param key The configuration key to look up
     * @param default_value The default value if key is not found or parsing fails
     * @return The parsed value or default
     */
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto parsed = get_optional<T>(config, key);
        return parsed ? *parsed : default_value;
    }

    /**
     * @brief Get a configuration value as optional
     * @return Optional containing the value if found and parseable, empty otherwise
     */
    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value<T>(it->second);
    }

    /**
     * @brief Check if a configuration key exists
     */
    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Check that a present key holds a value parseable as T
     *
     * Missing keys are considered well-formed.
     */
    template <typename T>
    static bool is_well_formed(const config_map& config, const std::string& key) {
        return !has_key(config, key) || get_optional<T>(config, key).has_value();
    }

   private:
    template <typename T>
    static std::optional<T> parse_value(const std::string& raw) {
        std::string str = trim(raw);
        if constexpr (std::is_same_v<T, bool>) {
            return parse_bool(str);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return str;
        } else if constexpr (std::is_integral_v<T>) {
            return parse_integral<T>(str);
        } else if constexpr (std::is_floating_point_v<T>) {
            return parse_floating<T>(str);
        } else {
            return std::nullopt;
        }
    }

    static std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return {};
        }
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

    /**
     * @brief Parse boolean value ("true", "1", "yes", "on" / "false", "0", "no", "off")
     */
    static std::optional<bool> parse_bool(const std::string& str) {
        std::string lower = str;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        return std::nullopt;
    }

    template <typename T>
    static std::optional<T> parse_integral(const std::string& str) {
        if (str.empty()) {
            return std::nullopt;
        }
        size_t consumed = 0;
        try {
            if constexpr (std::is_signed_v<T>) {
                long long value = std::stoll(str, &consumed);
                if (consumed != str.size() || value < std::numeric_limits<T>::min() ||
                    value > std::numeric_limits<T>::max()) {
                    return std::nullopt;
                }
                return static_cast<T>(value);
            } else {
                unsigned long long value = std::stoull(str, &consumed);
                if (consumed != str.size() || str.front() == '-' ||
                    value > std::numeric_limits<T>::max()) {
                    return std::nullopt;
                }
                return static_cast<T>(value);
            }
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    template <typename T>
    static std::optional<T> parse_floating(const std::string& str) {
        if (str.empty()) {
            return std::nullopt;
        }
        size_t consumed = 0;
        try {
            T value;
            if constexpr (std::is_same_v<T, float>) {
                value = std::stof(str, &consumed);
            } else if constexpr (std::is_same_v<T, double>) {
                value = std::stod(str, &consumed);
            } else {
                value = static_cast<T>(std::stold(str, &consumed));
            }
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
};

}  // namespace gpudiag
