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
#include "ostress_report.h"

#include <fstream>

#include <absl/strings/str_format.h>
#include <absl/strings/str_replace.h>
#include <absl/time/time.h>

#include "common/ostress_log.h"

namespace {

constexpr double MiB = 1024.0 * 1024.0;

const char latencyHeader[] =
    "  Latency (ms): |   Min  |   Avg  |   P50  |   P90  |   P99  |   Max  \n"
    "  --------------|--------|--------|--------|--------|--------|--------\n";

void
printLatencyRow(std::ostream &out, const char *label, const ostressLatencyStats &lat) {
    out << absl::StrFormat("  %-14s|%7.2f |%7.2f |%7.2f |%7.2f |%7.2f |%7.2f \n",
                           label,
                           ostressToMillis(lat.min()),
                           ostressToMillis(lat.avg()),
                           ostressToMillis(lat.p50()),
                           ostressToMillis(lat.p90()),
                           ostressToMillis(lat.p99()),
                           ostressToMillis(lat.max()));
}

std::string
csvField(const std::string &field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    return "\"" + absl::StrReplaceAll(field, {{"\"", "\"\""}}) + "\"";
}

std::string
csvTimestamp(std::chrono::system_clock::time_point tp) {
    return absl::FormatTime(absl::RFC3339_full, absl::FromChrono(tp), absl::UTCTimeZone());
}

} // namespace

double
ostressToMillis(ostress_duration_t d) {
    if (d < ostress_duration_t::zero()) return 0;
    return std::chrono::duration<double, std::milli>(d).count();
}

void
ostressPrintSummary(const ostressStats &stats, std::ostream &out) {
    const double seconds = std::chrono::duration<double>(stats.actualDuration()).count();

    out << absl::StrFormat("\n--- Stress Test Summary --- (%.3fs) ---\n", seconds);
    out << "Overall:\n";
    out << absl::StrFormat("  Concurrency:    %d\n", stats.concurrency());
    out << absl::StrFormat(
        "  Total Requests: %d (%.2f req/s)\n", stats.totalRequests(), stats.requestRate());
    out << absl::StrFormat("  Total Success:  %d\n", stats.totalSuccesses());
    out << absl::StrFormat("  Total Errors:   %d\n", stats.totalErrors());

    out << absl::StrFormat("\nGET Operations (%d total):\n", stats.totalGets());
    out << absl::StrFormat("  Success:        %d\n", stats.getSuccesses());
    out << absl::StrFormat("  Bytes D/L:      %d (%.2f MiB)\n",
                           stats.totalBytesDown(),
                           stats.totalBytesDown() / MiB);
    out << absl::StrFormat("  Avg Throughput: %.2f MiB/s\n", stats.throughputDown() / MiB);
    if (stats.getTtfb().count() > 0) {
        out << latencyHeader;
        printLatencyRow(out, "TTFB (proxy)", stats.getTtfb());
        printLatencyRow(out, "TTLB (body)", stats.getTtlb());
    } else {
        out << "  No successful GETs to calculate latency.\n";
    }

    out << absl::StrFormat("\nPUT Operations (%d total):\n", stats.totalPuts());
    out << absl::StrFormat("  Success:        %d\n", stats.putSuccesses());
    out << absl::StrFormat(
        "  Bytes U/L:      %d (%.2f MiB)\n", stats.totalBytesUp(), stats.totalBytesUp() / MiB);
    if (stats.putSuccesses() > 0) {
        out << absl::StrFormat("  Object Size:    %.2f KiB\n",
                               stats.totalBytesUp() / 1024.0 / stats.putSuccesses());
    }
    out << absl::StrFormat("  Avg Throughput: %.2f MiB/s\n", stats.throughputUp() / MiB);
    if (stats.putTtlb().count() > 0) {
        out << latencyHeader;
        printLatencyRow(out, "TTLB (total)", stats.putTtlb());
    } else {
        out << "  No successful PUTs to calculate latency.\n";
    }

    out << "----------------------------------------\n";
}

ostress_status_t
ostressWriteResultsCsv(const std::vector<ostressResult> &results, std::ostream &out) {
    out << "Timestamp,Operation,ObjectKey,TTFB(ms),TTLB(ms),BytesDownloaded,BytesUploaded,Error\n";

    for (const auto &r : results) {
        out << csvTimestamp(r.timestamp) << ',' << ostressEnumStrings::opStr(r.op) << ','
            << csvField(r.key) << ',' << absl::StrFormat("%.3f", ostressToMillis(r.ttfb)) << ','
            << absl::StrFormat("%.3f", ostressToMillis(r.ttlb)) << ',' << r.bytesDownloaded
            << ',' << r.bytesUploaded << ',' << csvField(r.error) << '\n';
    }

    out.flush();
    if (!out) {
        OSTRESS_ERROR << "Failed to write results CSV";
        return OSTRESS_ERR_BACKEND;
    }
    return OSTRESS_SUCCESS;
}

ostress_status_t
ostressWriteResultsCsv(const std::vector<ostressResult> &results, const std::string &path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        OSTRESS_ERROR << "Failed to create CSV file " << path;
        return OSTRESS_ERR_BACKEND;
    }

    const ostress_status_t status = ostressWriteResultsCsv(results, file);
    if (status != OSTRESS_SUCCESS) {
        OSTRESS_ERROR << "Results CSV " << path << " is incomplete";
        return status;
    }

    OSTRESS_INFO << "Detailed results written to " << path;
    return OSTRESS_SUCCESS;
}
