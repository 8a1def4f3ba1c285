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
#include "ostress_log.h"

#include <cstdlib>
#include <mutex>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/strings/ascii.h>

namespace {

struct logLevel {
    absl::LogSeverityAtLeast minSeverity;
    int verbosity;
};

bool
parseLevel(const std::string &level, logLevel &out) {
    const std::string lower = absl::AsciiStrToLower(level);
    if (lower == "debug") {
        out = {absl::LogSeverityAtLeast::kInfo, 2};
    } else if (lower == "info") {
        out = {absl::LogSeverityAtLeast::kInfo, 0};
    } else if (lower == "warn" || lower == "warning") {
        out = {absl::LogSeverityAtLeast::kWarning, 0};
    } else if (lower == "error") {
        out = {absl::LogSeverityAtLeast::kError, 0};
    } else {
        return false;
    }
    return true;
}

} // namespace

void
ostressLogInit(const std::string &level) {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() { absl::InitializeLog(); });

    logLevel parsed{absl::LogSeverityAtLeast::kInfo, 0};
    const bool known = parseLevel(level, parsed);

    absl::SetMinLogLevel(parsed.minSeverity);
    absl::SetStderrThreshold(parsed.minSeverity);
    absl::SetGlobalVLogThreshold(parsed.verbosity);

    if (!known) {
        OSTRESS_WARN << "Unknown log level '" << level << "', using 'info'";
    }
    OSTRESS_DEBUG << "Logger initialized at level " << level;
}

std::string
ostressLogLevelFromEnv(const std::string &fallback) {
    if (const char *value = std::getenv(ostressLogLevelVar)) {
        if (value[0] != '\0') return value;
    }
    return fallback;
}
