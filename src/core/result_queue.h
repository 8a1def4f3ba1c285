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
#ifndef OSTRESS_SRC_CORE_RESULT_QUEUE_H
#define OSTRESS_SRC_CORE_RESULT_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @class ostressResultQueue
 * @brief Bounded multi-producer, single-consumer hand-off between workers
 *        and the statistics consumer.
 *
 * Producers never block: tryPush() fails when the queue is full and the
 * caller drops the item. The consumer blocks in pop() until an item is
 * available or the queue is closed and drained.
 */
template<typename T> class ostressResultQueue {
public:
    explicit ostressResultQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    ostressResultQueue(const ostressResultQueue &) = delete;
    ostressResultQueue &
    operator=(const ostressResultQueue &) = delete;

    /** @return false if the queue is full or closed */
    bool
    tryPush(T &&item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /** @return std::nullopt once the queue is closed and empty */
    std::optional<T>
    pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /** @brief Signal that no producer will push again. */
    void
    close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t
    capacity() const {
        return capacity_;
    }

    size_t
    size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

#endif
