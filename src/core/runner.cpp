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
#include "ostress.h"

#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>

#include <asio.hpp>
#include <absl/strings/str_cat.h>

#include "common/ostress_log.h"
#include "duration.h"
#include "executor.h"
#include "manifest.h"
#include "result_queue.h"
#include "workload.h"

namespace {

using steady = std::chrono::steady_clock;
using resultQueue = ostressResultQueue<ostressResult>;

/**
 * State shared by the workers of one run. Everything but the queue, the
 * manifest sink and the counters is read-only while workers are running.
 */
struct workerShared {
    const ostressRunConfig &cfg;
    const ostress_mode_t mode;
    iObjClient &client;
    const std::vector<std::string> &keys;
    ostressManifestWriter *manifest;
    const ostressRunContext &ctx;
    resultQueue &results;
    std::atomic<uint64_t> dropped{0};
    std::atomic<bool> failed{false};
};

class ostressWorker {
public:
    ostressWorker(workerShared &shared, int id)
        : shared_(shared),
          id_(id),
          owner_(absl::StrCat("worker", id)),
          rng_(ostressMakeWorkerRng(id)) {
        if (shared_.mode != ostress_mode_t::WRITE) {
            selector_.emplace(shared_.keys, id, shared_.cfg.randomize);
        }
        if (shared_.mode != ostress_mode_t::READ) {
            payload_.emplace(shared_.cfg.putSizeBytes());
        }
    }

    /** @brief Loop until the run is done. */
    void
    runContinuous() {
        OSTRESS_DEBUG << "Worker " << id_ << " started ("
                      << ostressEnumStrings::modeStr(shared_.mode) << ")";
        while (!shared_.ctx.isDone()) {
            if (!emit(doOne())) break;
        }
        OSTRESS_DEBUG << "Worker " << id_ << " stopped: "
                      << ostressEnumStrings::statusStr(shared_.ctx.err());
    }

    /** @brief One PUT per job until the jobs run out or the run is done. */
    void
    runJobs(ostressResultQueue<int> &jobs) {
        OSTRESS_DEBUG << "Worker " << id_ << " started (fixed count)";
        while (!shared_.ctx.isDone()) {
            const std::optional<int> job = jobs.pop();
            if (!job) {
                OSTRESS_DEBUG << "Worker " << id_ << " stopped: no jobs left";
                return;
            }
            if (!emit(doPut(absl::StrCat("job", *job)))) break;
        }
        OSTRESS_DEBUG << "Worker " << id_ << " stopped: "
                      << ostressEnumStrings::statusStr(shared_.ctx.err());
    }

private:
    ostressResult
    doOne() {
        switch (shared_.mode) {
        case ostress_mode_t::READ:
            return doGet();
        case ostress_mode_t::WRITE:
            return doPut(owner_);
        case ostress_mode_t::MIXED:
            return ostressPickGet(rng_) ? doGet() : doPut(owner_);
        }
        throw std::logic_error("unhandled operation mode");
    }

    ostressResult
    doGet() {
        const std::string &key = selector_->next(rng_);
        return ostressPerformGet(shared_.client, shared_.cfg.s3.bucket, key);
    }

    ostressResult
    doPut(const std::string &owner) {
        const std::string key = ostressMakeObjectKey(owner, rng_);
        payload_->refill(rng_);

        ostressResult result = ostressPerformPut(
            shared_.client, shared_.cfg.s3.bucket, key, payload_->data(), payload_->size());

        if (result.isSuccess() && shared_.manifest) {
            // Failure is logged by the sink; the object still exists
            (void)shared_.manifest->addKey(key);
        }
        return result;
    }

    /** @return false when the worker has to stop */
    bool
    emit(ostressResult &&result) {
        if (shared_.ctx.isDone()) {
            return false;
        }

        if (!shared_.results.tryPush(std::move(result))) {
            shared_.dropped.fetch_add(1, std::memory_order_relaxed);
            OSTRESS_WARN << "Result channel full, dropping result for " << result.key;
        }
        return true;
    }

    workerShared &shared_;
    const int id_;
    const std::string owner_;
    ostress_rng_t rng_;
    std::optional<ostressKeySelector> selector_;
    std::optional<ostressPayload> payload_;
};

void
runWorker(workerShared &shared, int id, ostressResultQueue<int> *jobs) {
    try {
        ostressWorker worker(shared, id);
        if (jobs) {
            worker.runJobs(*jobs);
        } else {
            worker.runContinuous();
        }
    }
    catch (const std::exception &e) {
        OSTRESS_ERROR << "Worker " << id << " terminated: " << e.what();
        shared.failed.store(true);
    }
}

} // namespace

ostressRunner::ostressRunner(const ostressRunConfig &cfg,
                             std::shared_ptr<iObjClient> client,
                             std::vector<std::string> keys,
                             std::shared_ptr<ostressManifestWriter> manifest)
    : cfg_(cfg),
      client_(std::move(client)),
      keys_(std::move(keys)),
      manifest_(std::move(manifest)) {
    if (!client_) {
        throw std::invalid_argument("ostressRunner requires an object client");
    }
}

ostress_status_t
ostressRunner::checkSetup(const ostressRunConfig &cfg,
                          size_t num_keys,
                          ostress_duration_t &duration) {
    if (ostressParseDuration(cfg.duration, duration) != OSTRESS_SUCCESS) {
        OSTRESS_ERROR << "Invalid duration format: " << cfg.duration;
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (cfg.concurrency <= 0) {
        OSTRESS_ERROR << "Concurrency must be positive, got " << cfg.concurrency;
        return OSTRESS_ERR_INVALID_PARAM;
    }

    const ostress_mode_t mode = cfg.mode();
    if (mode != ostress_mode_t::WRITE && num_keys == 0) {
        OSTRESS_ERROR << "No keys to read for " << ostressEnumStrings::modeStr(mode) << " mode";
        return OSTRESS_ERR_INVALID_PARAM;
    }
    return OSTRESS_SUCCESS;
}

ostress_status_t
ostressRunner::run(const ostressRunContext &parent,
                   std::vector<ostressResult> &results,
                   ostressStats &stats) {
    dropped_ = 0;

    ostress_duration_t duration;
    const ostress_status_t setup = checkSetup(cfg_, keys_.size(), duration);
    if (setup != OSTRESS_SUCCESS) {
        return setup;
    }

    const ostress_mode_t mode = cfg_.mode();
    const bool fixed_count = cfg_.isFixedCount();
    const auto start = steady::now();

    // The file count, not the duration, bounds a fixed-count run
    std::optional<steady::time_point> deadline;
    if (!fixed_count) {
        deadline = start + duration;
    }
    ostressRunContext run_ctx(&parent, deadline);

    resultQueue queue(static_cast<size_t>(cfg_.concurrency) * 2);
    workerShared shared{cfg_, mode, *client_, keys_, manifest_.get(), run_ctx, queue};

    std::unique_ptr<ostressResultQueue<int>> jobs;
    if (fixed_count) {
        jobs = std::make_unique<ostressResultQueue<int>>(cfg_.fileCount);
        for (int job = 0; job < cfg_.fileCount; job++) {
            if (!jobs->tryPush(int(job))) {
                OSTRESS_ERROR << "Failed to queue job " << job;
                return OSTRESS_ERR_UNKNOWN;
            }
        }
        jobs->close();
        OSTRESS_INFO << "Generating " << cfg_.fileCount << " objects with " << cfg_.concurrency
                     << " workers";
    } else {
        OSTRESS_INFO << "Starting " << cfg_.concurrency << " workers in "
                     << ostressEnumStrings::modeStr(mode) << " mode for " << cfg_.duration;
    }

    asio::thread_pool pool(cfg_.concurrency);
    for (int id = 0; id < cfg_.concurrency; id++) {
        asio::post(pool, [&shared, id, &jobs]() { runWorker(shared, id, jobs.get()); });
    }

    // Close the channel only once every worker has returned
    std::thread closer([&pool, &queue]() {
        pool.join();
        queue.close();
    });

    std::vector<ostressResult> collected;
    ostressStats aggregate(cfg_.concurrency);
    while (std::optional<ostressResult> result = queue.pop()) {
        if (hook_) {
            hook_(*result);
        }
        if (aggregate.addResult(*result) != OSTRESS_SUCCESS) {
            OSTRESS_ERROR << "Dropping result for " << result->key;
            continue;
        }
        collected.push_back(std::move(*result));
    }
    closer.join();

    const auto end = steady::now();
    if (aggregate.finalize(start, end) != OSTRESS_SUCCESS) {
        return OSTRESS_ERR_UNKNOWN;
    }

    dropped_ = shared.dropped.load();
    if (dropped_) {
        OSTRESS_WARN << dropped_ << " results were dropped because the result channel was full";
    }
    OSTRESS_INFO << "Run finished after " << collected.size() << " results ("
                 << ostressEnumStrings::statusStr(run_ctx.err()) << ")";

    results = std::move(collected);
    stats = std::move(aggregate);

    if (shared.failed.load()) {
        OSTRESS_ERROR << "Run terminated unexpectedly";
        return OSTRESS_ERR_UNKNOWN;
    }
    return OSTRESS_SUCCESS;
}
