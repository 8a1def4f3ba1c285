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
#ifndef _OSTRESS_REPORT_H
#define _OSTRESS_REPORT_H

#include <ostream>
#include <string>
#include <vector>
#include "ostress_stats.h"

/**
 * @brief Print the human readable summary of a finalized run.
 */
void
ostressPrintSummary(const ostressStats &stats, std::ostream &out);

/**
 * @brief Export every result as one CSV row.
 *
 * Columns: Timestamp, Operation, ObjectKey, TTFB(ms), TTLB(ms),
 * BytesDownloaded, BytesUploaded, Error. Unmeasured timings are written as
 * 0.000.
 *
 * @return OSTRESS_ERR_BACKEND if the file cannot be created or written
 */
ostress_status_t
ostressWriteResultsCsv(const std::vector<ostressResult> &results, const std::string &path);

/**
 * @brief Same as ostressWriteResultsCsv() into an open stream.
 */
ostress_status_t
ostressWriteResultsCsv(const std::vector<ostressResult> &results, std::ostream &out);

/**
 * @brief Duration in milliseconds, 0 for an unmeasured value.
 */
double
ostressToMillis(ostress_duration_t d);

#endif
