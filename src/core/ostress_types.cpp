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
#include "ostress_types.h"

#include <array>
#include <absl/strings/ascii.h>

std::string
ostressEnumStrings::statusStr(const ostress_status_t &status) {
    switch (status) {
    case OSTRESS_SUCCESS:
        return "OSTRESS_SUCCESS";
    case OSTRESS_ERR_INVALID_PARAM:
        return "OSTRESS_ERR_INVALID_PARAM";
    case OSTRESS_ERR_NOT_FOUND:
        return "OSTRESS_ERR_NOT_FOUND";
    case OSTRESS_ERR_BACKEND:
        return "OSTRESS_ERR_BACKEND";
    case OSTRESS_ERR_MISMATCH:
        return "OSTRESS_ERR_MISMATCH";
    case OSTRESS_ERR_NOT_ALLOWED:
        return "OSTRESS_ERR_NOT_ALLOWED";
    case OSTRESS_ERR_CANCELED:
        return "OSTRESS_ERR_CANCELED";
    case OSTRESS_ERR_TIMEOUT:
        return "OSTRESS_ERR_TIMEOUT";
    case OSTRESS_ERR_UNKNOWN:
        return "OSTRESS_ERR_UNKNOWN";
    }
    return "BAD_STATUS";
}

std::string
ostressEnumStrings::opStr(const ostress_op_t &op) {
    static const std::array<std::string, 2> op_str = {"GET", "PUT"};
    size_t op_int = static_cast<size_t>(op);
    if (op_int >= op_str.size()) return "BAD_OP";
    return op_str[op_int];
}

std::string
ostressEnumStrings::modeStr(const ostress_mode_t &mode) {
    static const std::array<std::string, 3> mode_str = {"read", "write", "mixed"};
    size_t mode_int = static_cast<size_t>(mode);
    if (mode_int >= mode_str.size()) return "BAD_MODE";
    return mode_str[mode_int];
}

ostress_status_t
ostressEnumStrings::parseMode(const std::string &str, ostress_mode_t &mode) {
    const std::string lower = absl::AsciiStrToLower(str);
    if (lower == "read") {
        mode = ostress_mode_t::READ;
    } else if (lower == "write") {
        mode = ostress_mode_t::WRITE;
    } else if (lower == "mixed") {
        mode = ostress_mode_t::MIXED;
    } else {
        return OSTRESS_ERR_INVALID_PARAM;
    }
    return OSTRESS_SUCCESS;
}
