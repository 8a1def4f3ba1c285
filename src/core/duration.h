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
#ifndef OSTRESS_SRC_CORE_DURATION_H
#define OSTRESS_SRC_CORE_DURATION_H

#include <string>
#include "ostress_types.h"

/**
 * @brief Parse a run duration with unit suffixes ("300ms", "30s",
 *        "5m", "1h30m").
 * @return OSTRESS_ERR_INVALID_PARAM for unparsable or non-positive input
 */
ostress_status_t
ostressParseDuration(const std::string &str, ostress_duration_t &out);

#endif
