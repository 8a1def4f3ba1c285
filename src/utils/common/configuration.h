/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef OSTRESS_SRC_UTILS_COMMON_CONFIGURATION_H
#define OSTRESS_SRC_UTILS_COMMON_CONFIGURATION_H

#include <charconv>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <strings.h>
#include <type_traits>
#include <vector>

#include <absl/strings/str_join.h>

#include "ostress_log.h"

namespace ostress::config {

[[nodiscard]] inline std::optional<std::string>
getenvOptional(const std::string &name) {
    if (const char *value = std::getenv(name.c_str())) {
        OSTRESS_DEBUG << "Obtained environment variable " << name << "=" << value;
        return std::string(value);
    }
    OSTRESS_DEBUG << "Missing environment variable " << name;
    return std::nullopt;
}

template<typename, typename = void> struct convertTraits;

/** Case-insensitive switch words, as accepted by OSTRESS_* boolean variables */
template<> struct convertTraits<bool> {
    [[nodiscard]] static bool
    convert(const std::string &value) {
        static const std::vector<std::string> enabled = {"y", "yes", "on", "1", "true", "enable"};
        static const std::vector<std::string> disabled = {"n", "no", "off", "0", "false", "disable"};

        for (const std::string &word : enabled) {
            if (strcasecmp(word.c_str(), value.c_str()) == 0) return true;
        }
        for (const std::string &word : disabled) {
            if (strcasecmp(word.c_str(), value.c_str()) == 0) return false;
        }
        throw std::runtime_error("'" + value + "' is not a switch value, expected one of " +
                                 absl::StrJoin(enabled, ", ") + " or " +
                                 absl::StrJoin(disabled, ", "));
    }
};

template<> struct convertTraits<std::string> {
    [[nodiscard]] static std::string
    convert(const std::string &value) {
        return value;
    }
};

template<typename integer>
struct convertTraits<integer, std::enable_if_t<std::is_integral_v<integer>>> {
    [[nodiscard]] static integer
    convert(const std::string &value) {
        integer result;
        const char *end = value.data() + value.size();
        const auto status = std::from_chars(value.data(), end, result);
        if (status.ec == std::errc::invalid_argument) {
            throw std::runtime_error("Invalid integer string '" + value + "'");
        }
        if (status.ec == std::errc::result_out_of_range) {
            throw std::runtime_error("Integer string '" + value + "' out of range");
        }
        if (status.ptr != end) {
            throw std::runtime_error("Trailing garbage in integer string '" + value + "'");
        }
        return result;
    }
};

/**
 * Override @p value from the environment when @p env holds a convertible
 * value accepted by @p accept. Anything else leaves @p value untouched and
 * is reported as a warning.
 */
template<typename type, typename predicate, template<typename...> class traits = convertTraits>
void
overrideFromEnv(type &value, const std::string &env, predicate accept) {
    const auto opt = getenvOptional(env);
    if (!opt) {
        return;
    }
    try {
        const type converted = traits<type>::convert(*opt);
        if (accept(converted)) {
            value = converted;
            return;
        }
    }
    catch (const std::exception &e) {
        OSTRESS_DEBUG << "Conversion of " << env << " failed: " << e.what();
    }
    OSTRESS_WARN << "Invalid " << env << " value '" << *opt << "', keeping '" << value << "'";
}

template<typename type, template<typename...> class traits = convertTraits>
void
overrideFromEnv(type &value, const std::string &env) {
    overrideFromEnv<type>(value, env, [](const type &) { return true; });
}

} // namespace ostress::config

#endif
