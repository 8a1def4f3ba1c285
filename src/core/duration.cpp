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
#include "duration.h"

#include <absl/time/time.h>

ostress_status_t
ostressParseDuration(const std::string &str, ostress_duration_t &out) {
    absl::Duration parsed;
    if (!absl::ParseDuration(str, &parsed)) {
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (parsed <= absl::ZeroDuration() || parsed == absl::InfiniteDuration()) {
        return OSTRESS_ERR_INVALID_PARAM;
    }

    out = absl::ToChronoNanoseconds(parsed);
    return OSTRESS_SUCCESS;
}
