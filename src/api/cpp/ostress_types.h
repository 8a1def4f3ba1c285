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
#ifndef _OSTRESS_TYPES_H
#define _OSTRESS_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>

/**
 * @enum  ostress_status_t
 * @brief An enumeration of status values returned by ostress calls.
 */
enum ostress_status_t {
    OSTRESS_SUCCESS = 0,
    OSTRESS_ERR_INVALID_PARAM = -1,
    OSTRESS_ERR_NOT_FOUND = -2,
    OSTRESS_ERR_BACKEND = -3,
    OSTRESS_ERR_MISMATCH = -4,
    OSTRESS_ERR_NOT_ALLOWED = -5,
    OSTRESS_ERR_CANCELED = -6,
    OSTRESS_ERR_TIMEOUT = -7,
    OSTRESS_ERR_UNKNOWN = -8
};

/**
 * @enum  ostress_op_t
 * @brief Kind of a single object-store operation.
 */
enum class ostress_op_t { GET, PUT };

/**
 * @enum  ostress_mode_t
 * @brief Workload issued by every worker of a run.
 */
enum class ostress_mode_t { READ, WRITE, MIXED };

/** @brief Latency unit used throughout results and statistics. */
using ostress_duration_t = std::chrono::nanoseconds;

/**
 * @brief Reserved value of a timing field that was not measured
 *        (failed operation, or TTFB of a PUT). Never a real duration.
 */
constexpr ostress_duration_t OSTRESS_UNMEASURED{-1};

/**
 * @class ostressEnumStrings
 * @brief Conversions between ostress enumerations and printable text.
 */
class ostressEnumStrings {
public:
    static std::string
    statusStr(const ostress_status_t &status);
    static std::string
    opStr(const ostress_op_t &op);
    static std::string
    modeStr(const ostress_mode_t &mode);

    /**
     * @brief Parse "read", "write" or "mixed" (case-insensitive).
     *
     * @param str  Mode text
     * @param mode [out] Parsed mode
     * @return OSTRESS_SUCCESS, or OSTRESS_ERR_INVALID_PARAM for unknown text
     */
    static ostress_status_t
    parseMode(const std::string &str, ostress_mode_t &mode);
};

#endif
