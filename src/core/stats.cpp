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
#include "ostress_stats.h"

#include <algorithm>
#include <numeric>

#include "common/ostress_log.h"

/*
 * ostressLatencyStats
 */

void
ostressLatencyStats::add(ostress_duration_t value) {
    samples_.push_back(value);
}

void
ostressLatencyStats::reserve(size_t n) {
    samples_.reserve(n);
}

ostress_duration_t
ostressLatencyStats::percentile(const std::vector<ostress_duration_t> &sorted, int percentile) {
    const size_t n = sorted.size();
    if (n == 0) return ostress_duration_t{0};
    if (n == 1) return sorted[0];
    if (n == 2) return percentile <= 50 ? sorted[0] : sorted[1];

    const int clamped = std::clamp(percentile, 0, 100);
    const size_t index = static_cast<size_t>(clamped) * n / 100;
    return sorted[std::min(index, n - 1)];
}

void
ostressLatencyStats::finalize() {
    if (samples_.empty()) {
        min_ = max_ = avg_ = p50_ = p90_ = p99_ = ostress_duration_t{0};
        return;
    }

    std::sort(samples_.begin(), samples_.end());
    min_ = samples_.front();
    max_ = samples_.back();

    // Mean over long double: a few million nanosecond samples overflow int64 sums
    const long double sum = std::accumulate(
        samples_.begin(), samples_.end(), 0.0L,
        [](long double acc, ostress_duration_t d) { return acc + d.count(); });
    avg_ = ostress_duration_t{static_cast<int64_t>(sum / samples_.size())};

    p50_ = percentile(samples_, 50);
    p90_ = percentile(samples_, 90);
    p99_ = percentile(samples_, 99);
}

/*
 * ostressStats
 */

ostress_status_t
ostressStats::addResult(const ostressResult &result) {
    if (finalized_) {
        OSTRESS_ERROR << "Result for " << result.key << " arrived after finalization";
        return OSTRESS_ERR_NOT_ALLOWED;
    }

    totalRequests_++;
    const bool success = result.isSuccess();

    if (result.op == ostress_op_t::GET) {
        totalGets_++;
        if (!success) {
            totalErrors_++;
            getErrors_++;
            return OSTRESS_SUCCESS;
        }
        totalBytesDown_ += result.bytesDownloaded;
        if (result.ttfb >= ostress_duration_t::zero()) getTtfb_.add(result.ttfb);
        if (result.ttlb >= ostress_duration_t::zero()) getTtlb_.add(result.ttlb);
        return OSTRESS_SUCCESS;
    }

    totalPuts_++;
    if (!success) {
        totalErrors_++;
        putErrors_++;
        return OSTRESS_SUCCESS;
    }
    totalBytesUp_ += result.bytesUploaded;
    if (result.ttlb >= ostress_duration_t::zero()) putTtlb_.add(result.ttlb);
    return OSTRESS_SUCCESS;
}

ostress_status_t
ostressStats::finalize(std::chrono::steady_clock::time_point start,
                       std::chrono::steady_clock::time_point end) {
    if (finalized_) {
        OSTRESS_ERROR << "Statistics were already finalized";
        return OSTRESS_ERR_NOT_ALLOWED;
    }

    actualDuration_ = std::chrono::duration_cast<ostress_duration_t>(end - start);
    getTtfb_.finalize();
    getTtlb_.finalize();
    putTtlb_.finalize();
    finalized_ = true;
    return OSTRESS_SUCCESS;
}

double
ostressStats::perSecond(double value) const {
    if (actualDuration_ <= ostress_duration_t::zero()) return 0;
    return value / std::chrono::duration<double>(actualDuration_).count();
}

double
ostressStats::requestRate() const {
    return perSecond(static_cast<double>(totalRequests_));
}

double
ostressStats::throughputDown() const {
    return perSecond(static_cast<double>(totalBytesDown_));
}

double
ostressStats::throughputUp() const {
    return perSecond(static_cast<double>(totalBytesUp_));
}
