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
#ifndef OSTRESS_SRC_UTILS_COMMON_OSTRESS_LOG_H
#define OSTRESS_SRC_UTILS_COMMON_OSTRESS_LOG_H

#include <string>

#include <absl/log/log.h>

#define OSTRESS_ERROR LOG(ERROR)
#define OSTRESS_WARN LOG(WARNING)
#define OSTRESS_INFO LOG(INFO)
#define OSTRESS_DEBUG VLOG(1)
#define OSTRESS_TRACE VLOG(2)

constexpr const char ostressLogLevelVar[] = "OSTRESS_LOG_LEVEL";

/**
 * @brief Initialize abseil logging for the process at the given level
 *        ("debug", "info", "warn" or "error", case-insensitive). An unknown
 *        level falls back to "info". Safe to call more than once; only the
 *        first call initializes the log sinks.
 */
void
ostressLogInit(const std::string &level);

/**
 * @brief Level taken from OSTRESS_LOG_LEVEL, or the given fallback.
 */
std::string
ostressLogLevelFromEnv(const std::string &fallback);

#endif
