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
#include "ostress_run_context.h"

ostressRunContext::ostressRunContext(const ostressRunContext *parent,
                                     std::optional<clock::time_point> deadline)
    : parent_(parent),
      deadline_(deadline) {}

void
ostressRunContext::cancel() noexcept {
    cancelled_.store(true, std::memory_order_relaxed);
}

bool
ostressRunContext::isDone() const noexcept {
    return err() != OSTRESS_SUCCESS;
}

ostress_status_t
ostressRunContext::err() const noexcept {
    if (cancelled_.load(std::memory_order_relaxed)) {
        return OSTRESS_ERR_CANCELED;
    }

    if (parent_) {
        const ostress_status_t parent_status = parent_->err();
        if (parent_status != OSTRESS_SUCCESS) {
            return parent_status;
        }
    }

    if (deadline_ && clock::now() >= *deadline_) {
        return OSTRESS_ERR_TIMEOUT;
    }
    return OSTRESS_SUCCESS;
}
