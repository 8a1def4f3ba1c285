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
#ifndef _OSTRESS_STATS_H
#define _OSTRESS_STATS_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "ostress_types.h"

/**
 * @struct ostressResult
 * @brief  Outcome of one attempted operation. Created once when the
 *         operation concludes and never modified afterwards.
 *
 * A successful result carries meaningful timing and byte fields. A failed
 * one carries the error text; its timings are OSTRESS_UNMEASURED unless an
 * earlier stage (the header phase of a GET) completed before the failure.
 */
struct ostressResult {
    std::chrono::system_clock::time_point timestamp;
    ostress_op_t op = ostress_op_t::GET;
    std::string key;
    /** @var GET: time until the store answered. PUT: always unmeasured */
    ostress_duration_t ttfb = OSTRESS_UNMEASURED;
    /** @var GET: time until the body was consumed. PUT: call duration */
    ostress_duration_t ttlb = OSTRESS_UNMEASURED;
    uint64_t bytesDownloaded = 0;
    uint64_t bytesUploaded = 0;
    /** @var Empty on success */
    std::string error;

    bool
    isSuccess() const {
        return error.empty();
    }
};

/**
 * @class ostressLatencyStats
 * @brief Sample collection of one latency metric with derived figures.
 *
 * Samples are appended while the run is collecting. finalize() sorts them
 * and computes min/avg/percentiles/max; an empty collection reports zero
 * for every figure.
 */
class ostressLatencyStats {
public:
    void
    add(ostress_duration_t value);

    void
    reserve(size_t n);

    void
    finalize();

    size_t
    count() const {
        return samples_.size();
    }

    ostress_duration_t
    min() const {
        return min_;
    }

    ostress_duration_t
    max() const {
        return max_;
    }

    ostress_duration_t
    avg() const {
        return avg_;
    }

    ostress_duration_t
    p50() const {
        return p50_;
    }

    ostress_duration_t
    p90() const {
        return p90_;
    }

    ostress_duration_t
    p99() const {
        return p99_;
    }

    const std::vector<ostress_duration_t> &
    samples() const {
        return samples_;
    }

    /**
     * @brief Nearest-rank percentile over ascending samples.
     *
     * One sample answers every percentile. Two samples answer the lower
     * one up to P50 and the higher one above it. Otherwise the index is
     * floor(percentile / 100 * N) clamped to [0, N - 1].
     */
    static ostress_duration_t
    percentile(const std::vector<ostress_duration_t> &sorted, int percentile);

private:
    std::vector<ostress_duration_t> samples_;
    ostress_duration_t min_{0};
    ostress_duration_t max_{0};
    ostress_duration_t avg_{0};
    ostress_duration_t p50_{0};
    ostress_duration_t p90_{0};
    ostress_duration_t p99_{0};
};

/**
 * @class ostressStats
 * @brief Aggregate statistics of one run.
 *
 * Mutated by a single consumer only, hence no internal locking. The
 * lifecycle is collecting (addResult) then one finalize() call, after which
 * the object is read-only.
 */
class ostressStats {
public:
    explicit ostressStats(int concurrency = 0) : concurrency_(concurrency) {}

    /**
     * @brief Account one result. Failed results only touch the counters.
     * @return OSTRESS_ERR_NOT_ALLOWED once finalized
     */
    ostress_status_t
    addResult(const ostressResult &result);

    /**
     * @brief Freeze the statistics over the measured wall-clock window.
     * @return OSTRESS_ERR_NOT_ALLOWED when called a second time
     */
    ostress_status_t
    finalize(std::chrono::steady_clock::time_point start,
             std::chrono::steady_clock::time_point end);

    bool
    isFinalized() const {
        return finalized_;
    }

    int
    concurrency() const {
        return concurrency_;
    }

    uint64_t
    totalRequests() const {
        return totalRequests_;
    }

    uint64_t
    totalGets() const {
        return totalGets_;
    }

    uint64_t
    totalPuts() const {
        return totalPuts_;
    }

    uint64_t
    totalSuccesses() const {
        return totalRequests_ - totalErrors_;
    }

    uint64_t
    totalErrors() const {
        return totalErrors_;
    }

    uint64_t
    getErrors() const {
        return getErrors_;
    }

    uint64_t
    putErrors() const {
        return putErrors_;
    }

    uint64_t
    getSuccesses() const {
        return totalGets_ - getErrors_;
    }

    uint64_t
    putSuccesses() const {
        return totalPuts_ - putErrors_;
    }

    uint64_t
    totalBytesDown() const {
        return totalBytesDown_;
    }

    uint64_t
    totalBytesUp() const {
        return totalBytesUp_;
    }

    const ostressLatencyStats &
    getTtfb() const {
        return getTtfb_;
    }

    const ostressLatencyStats &
    getTtlb() const {
        return getTtlb_;
    }

    const ostressLatencyStats &
    putTtlb() const {
        return putTtlb_;
    }

    ostress_duration_t
    actualDuration() const {
        return actualDuration_;
    }

    /** @brief Requests per second, 0 for a non-positive duration */
    double
    requestRate() const;

    /** @brief Downloaded bytes per second, 0 for a non-positive duration */
    double
    throughputDown() const;

    /** @brief Uploaded bytes per second, 0 for a non-positive duration */
    double
    throughputUp() const;

private:
    double
    perSecond(double value) const;

    int concurrency_;
    bool finalized_ = false;

    uint64_t totalRequests_ = 0;
    uint64_t totalGets_ = 0;
    uint64_t totalPuts_ = 0;
    uint64_t totalErrors_ = 0;
    uint64_t getErrors_ = 0;
    uint64_t putErrors_ = 0;
    uint64_t totalBytesDown_ = 0;
    uint64_t totalBytesUp_ = 0;

    ostressLatencyStats getTtfb_;
    ostressLatencyStats getTtlb_;
    ostressLatencyStats putTtlb_;

    ostress_duration_t actualDuration_{0};
};

#endif
