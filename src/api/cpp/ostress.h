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
#ifndef _OSTRESS_H
#define _OSTRESS_H

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ostress_types.h"
#include "ostress_params.h"
#include "ostress_stats.h"
#include "ostress_run_context.h"
#include "ostress_obj_client.h"

class ostressManifestWriter;

/** Called by the consumer for every result it takes off the queue; must not throw */
using ostressResultHook = std::function<void(const ostressResult &)>;

/**
 * @class ostressRunner
 * @brief Drives one stress run against an already constructed client.
 *
 * Continuous mode starts exactly `concurrency` workers that loop until the
 * run context is done. Fixed-count mode (write with a file count) drains a
 * queue of job identifiers with `concurrency` workers, one PUT per job.
 * Every emitted result flows through a bounded queue into a single
 * statistics consumer; the queue is closed only after all workers joined.
 */
class ostressRunner {
public:
    /**
     * @param cfg      Validated run configuration
     * @param client   Store capability shared by all workers
     * @param keys     Keys to read, required non-empty for read/mixed modes
     * @param manifest Sink recording successful PUT keys (may be null)
     */
    ostressRunner(const ostressRunConfig &cfg,
                  std::shared_ptr<iObjClient> client,
                  std::vector<std::string> keys,
                  std::shared_ptr<ostressManifestWriter> manifest = nullptr);

    /**
     * @brief Run until the configured duration elapses, the parent
     *        context is cancelled, or (fixed-count mode) the jobs run out.
     *
     * Expiry and cancellation are not errors: the partial results and the
     * finalized statistics are returned with OSTRESS_SUCCESS.
     *
     * @param parent  External cancellation, e.g. an operator interrupt
     * @param results [out] Every emitted result in consumption order
     * @param stats   [out] Finalized statistics of the run
     * @return OSTRESS_ERR_INVALID_PARAM for a bad duration, concurrency or
     *         missing keys, OSTRESS_SUCCESS otherwise
     */
    ostress_status_t
    run(const ostressRunContext &parent,
        std::vector<ostressResult> &results,
        ostressStats &stats);

    /**
     * @brief Check the parameters a run cannot start without.
     *
     * @param cfg      Run configuration
     * @param num_keys Number of keys available to read
     * @param duration [out] Parsed run length
     * @return OSTRESS_ERR_INVALID_PARAM for a bad duration, concurrency or
     *         missing keys, OSTRESS_SUCCESS otherwise
     */
    static ostress_status_t
    checkSetup(const ostressRunConfig &cfg, size_t num_keys, ostress_duration_t &duration);

    void
    setResultHook(ostressResultHook hook) {
        hook_ = std::move(hook);
    }

    /** @return Results of the last run dropped on a full queue */
    uint64_t
    droppedResults() const {
        return dropped_;
    }

private:
    const ostressRunConfig cfg_;
    std::shared_ptr<iObjClient> client_;
    const std::vector<std::string> keys_;
    std::shared_ptr<ostressManifestWriter> manifest_;
    ostressResultHook hook_;
    uint64_t dropped_ = 0;
};

/**
 * @brief Full run: load the key manifest (read/mixed), construct the S3
 *        client, open the manifest sink (write with manifest generation),
 *        then execute the run.
 *
 * Setup failures abort before any worker starts and are returned as an
 * error status after being logged. Graceful expiry or cancellation returns
 * OSTRESS_SUCCESS with partial results.
 */
ostress_status_t
ostressRunStressTest(const ostressRunContext &ctx,
                     const ostressRunConfig &cfg,
                     std::vector<ostressResult> &results,
                     ostressStats &stats);

/**
 * @brief Same as ostressRunStressTest() with an injected client.
 */
ostress_status_t
ostressRunStressTest(const ostressRunContext &ctx,
                     const ostressRunConfig &cfg,
                     std::shared_ptr<iObjClient> client,
                     std::vector<ostressResult> &results,
                     ostressStats &stats);

#endif
