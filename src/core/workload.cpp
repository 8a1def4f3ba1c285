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
#include "workload.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <absl/strings/str_format.h>

ostress_rng_t
ostressMakeWorkerRng(int worker_id) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::seed_seq seed{static_cast<uint64_t>(now),
                       static_cast<uint64_t>(now) >> 32,
                       static_cast<uint64_t>(worker_id)};
    return ostress_rng_t(seed);
}

ostressKeySelector::ostressKeySelector(const std::vector<std::string> &keys,
                                       int worker_id,
                                       bool randomize)
    : keys_(keys),
      randomize_(randomize),
      cursor_(0),
      dist_(0, keys.empty() ? 0 : keys.size() - 1) {
    if (keys_.empty()) {
        throw std::invalid_argument("Key selector requires at least one key");
    }
    cursor_ = static_cast<size_t>(worker_id) % keys_.size();
}

const std::string &
ostressKeySelector::next(ostress_rng_t &rng) {
    if (randomize_) {
        return keys_[dist_(rng)];
    }

    const std::string &key = keys_[cursor_];
    cursor_ = (cursor_ + 1) % keys_.size();
    return key;
}

std::string
ostressRandomString(size_t n, ostress_rng_t &rng) {
    static constexpr char letters[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::uniform_int_distribution<size_t> dist(0, sizeof(letters) - 2);

    std::string out(n, '\0');
    for (auto &c : out) {
        c = letters[dist(rng)];
    }
    return out;
}

std::string
ostressMakeObjectKey(const std::string &owner, ostress_rng_t &rng) {
    const auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    return absl::StrFormat("ostress/%s/%d-%s.dat", owner, now, ostressRandomString(8, rng));
}

bool
ostressPickGet(ostress_rng_t &rng) {
    return std::bernoulli_distribution(0.5)(rng);
}

void
ostressPayload::refill(ostress_rng_t &rng) {
    size_t offset = 0;
    while (offset < buffer_.size()) {
        const uint64_t word = rng();
        const size_t chunk = std::min(sizeof(word), buffer_.size() - offset);
        std::memcpy(buffer_.data() + offset, &word, chunk);
        offset += chunk;
    }
}
