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
#ifndef _OSTRESS_RUN_CONTEXT_H
#define _OSTRESS_RUN_CONTEXT_H

#include <atomic>
#include <chrono>
#include <optional>
#include "ostress_types.h"

/**
 * @class ostressRunContext
 * @brief Cooperative cancellation signal shared by the workers of a run.
 *
 * A context is done once cancel() was called on it or on any ancestor, or
 * once its deadline has passed. Nothing is interrupted: workers poll
 * isDone() between operations. cancel() is a single lock-free store and
 * may be called from a signal handler.
 */
class ostressRunContext {
public:
    using clock = std::chrono::steady_clock;

    ostressRunContext() = default;

    /**
     * @param parent   Context whose cancellation propagates to this one,
     *                 must outlive it (may be null)
     * @param deadline Instant after which the context is done
     */
    explicit ostressRunContext(const ostressRunContext *parent,
                               std::optional<clock::time_point> deadline = std::nullopt);

    ostressRunContext(const ostressRunContext &) = delete;
    ostressRunContext &
    operator=(const ostressRunContext &) = delete;

    void
    cancel() noexcept;

    [[nodiscard]] bool
    isDone() const noexcept;

    /**
     * @return OSTRESS_SUCCESS while live, OSTRESS_ERR_CANCELED after an
     *         explicit cancellation, OSTRESS_ERR_TIMEOUT after the deadline
     */
    [[nodiscard]] ostress_status_t
    err() const noexcept;

    std::optional<clock::time_point>
    deadline() const {
        return deadline_;
    }

private:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancel() must be usable from a signal handler");

    const ostressRunContext *parent_ = nullptr;
    std::optional<clock::time_point> deadline_;
    std::atomic<bool> cancelled_{false};
};

#endif
