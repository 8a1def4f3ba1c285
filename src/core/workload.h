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
#ifndef OSTRESS_SRC_CORE_WORKLOAD_H
#define OSTRESS_SRC_CORE_WORKLOAD_H

#include <cstddef>
#include <random>
#include <string>
#include <vector>

/** @brief Pseudorandom generator owned by exactly one worker. */
using ostress_rng_t = std::mt19937_64;

/**
 * @brief Generator seeded from the monotonic clock and the worker identity,
 *        so concurrently started workers draw independent streams.
 */
ostress_rng_t
ostressMakeWorkerRng(int worker_id);

/**
 * @class ostressKeySelector
 * @brief Picks the key of the next GET for one worker.
 *
 * Sequential: worker i starts at index i mod K and advances by one after
 * every pick. Workers all use a stride of 1, so their cursors may cover
 * overlapping ranges; this is a reproducible traversal, not a partition of
 * the key space. Random: every pick draws uniformly from [0, K).
 */
class ostressKeySelector {
public:
    /**
     * @throws std::invalid_argument if keys is empty
     */
    ostressKeySelector(const std::vector<std::string> &keys, int worker_id, bool randomize);

    const std::string &
    next(ostress_rng_t &rng);

    size_t
    cursor() const {
        return cursor_;
    }

private:
    const std::vector<std::string> &keys_;
    const bool randomize_;
    size_t cursor_;
    std::uniform_int_distribution<size_t> dist_;
};

/**
 * @brief Alphanumeric string of length n.
 */
std::string
ostressRandomString(size_t n, ostress_rng_t &rng);

/**
 * @brief Key for a new object: "ostress/<owner>/<nanoseconds>-<suffix>.dat".
 *        Owner is the worker or job identity, the suffix is 8 random
 *        characters, which keeps keys unique without coordination.
 */
std::string
ostressMakeObjectKey(const std::string &owner, ostress_rng_t &rng);

/**
 * @brief Fair coin used by mixed mode: true selects a GET.
 */
bool
ostressPickGet(ostress_rng_t &rng);

/**
 * @class ostressPayload
 * @brief Upload buffer of a fixed size, refilled with fresh pseudorandom
 *        content before every PUT so the store cannot deduplicate it.
 */
class ostressPayload {
public:
    explicit ostressPayload(size_t size) : buffer_(size) {}

    void
    refill(ostress_rng_t &rng);

    const char *
    data() const {
        return buffer_.data();
    }

    size_t
    size() const {
        return buffer_.size();
    }

private:
    std::vector<char> buffer_;
};

#endif
