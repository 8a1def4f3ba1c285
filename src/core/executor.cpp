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
#include "executor.h"

#include <chrono>
#include <memory>
#include <vector>

#include "common/ostress_log.h"

namespace {

using steady = std::chrono::steady_clock;

ostress_duration_t
since(steady::time_point start) {
    return std::chrono::duration_cast<ostress_duration_t>(steady::now() - start);
}

} // namespace

ostressResult
ostressPerformGet(iObjClient &client, const std::string &bucket, const std::string &key) {
    ostressResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.op = ostress_op_t::GET;
    result.key = key;

    const auto start = steady::now();
    std::unique_ptr<iObjBody> body;
    std::string error;

    if (client.getObject(bucket, key, body, error) != OSTRESS_SUCCESS || !body) {
        result.error = error.empty() ? "GetObject failed" : error;
        OSTRESS_DEBUG << "GET " << key << " failed: " << result.error;
        return result;
    }
    result.ttfb = since(start);

    std::vector<char> chunk(OSTRESS_GET_CHUNK_SIZE);
    while (true) {
        size_t n = 0;
        if (body->read(chunk.data(), chunk.size(), n, error) != OSTRESS_SUCCESS) {
            result.ttlb = since(start);
            result.error = "body read error: " + error;
            OSTRESS_DEBUG << "GET " << key << " body failed after " << result.bytesDownloaded
                          << " bytes: " << error;
            return result;
        }
        if (n == 0) break;
        result.bytesDownloaded += n;
    }

    result.ttlb = since(start);
    OSTRESS_TRACE << "GET " << key << " " << result.bytesDownloaded << " bytes";
    return result;
}

ostressResult
ostressPerformPut(iObjClient &client,
                  const std::string &bucket,
                  const std::string &key,
                  const char *data,
                  size_t size) {
    ostressResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.op = ostress_op_t::PUT;
    result.key = key;

    const auto start = steady::now();
    std::string error;
    const ostress_status_t status = client.putObject(bucket, key, data, size, error);
    const auto elapsed = since(start);

    if (status != OSTRESS_SUCCESS) {
        result.error = error.empty() ? "PutObject failed" : error;
        OSTRESS_DEBUG << "PUT " << key << " failed: " << result.error;
        return result;
    }

    result.ttlb = elapsed;
    result.bytesUploaded = size;
    OSTRESS_TRACE << "PUT " << key << " " << size << " bytes";
    return result;
}
