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
#ifndef _OSTRESS_OBJ_CLIENT_H
#define _OSTRESS_OBJ_CLIENT_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include "ostress_types.h"

/**
 * Response body of a GET, consumed incrementally.
 */
class iObjBody {
public:
    virtual ~iObjBody() = default;

    /**
     * Read the next chunk of the body.
     * @param buf Destination buffer
     * @param len Capacity of buf
     * @param bytes_read [out] Number of bytes stored in buf, 0 at end of body
     * @param error [out] Failure description when the read fails
     * @return OSTRESS_SUCCESS or OSTRESS_ERR_BACKEND
     */
    virtual ostress_status_t
    read(char *buf, size_t len, size_t &bytes_read, std::string &error) = 0;
};

/**
 * Minimal object-store capability used by the stress engine.
 * Implementations must allow concurrent calls from many workers.
 */
class iObjClient {
public:
    virtual ~iObjClient() = default;

    /**
     * Fetch an object. Returns once the store answered the request; the
     * body is consumed by the caller through the returned stream.
     * @param bucket Bucket name
     * @param key The object key
     * @param body [out] Response body on success
     * @param error [out] Failure description
     * @return OSTRESS_SUCCESS or OSTRESS_ERR_BACKEND
     */
    virtual ostress_status_t
    getObject(std::string_view bucket,
              std::string_view key,
              std::unique_ptr<iObjBody> &body,
              std::string &error) = 0;

    /**
     * Upload a complete object.
     * @param bucket Bucket name
     * @param key The object key
     * @param data Payload to upload
     * @param data_len Length of the payload in bytes
     * @param error [out] Failure description
     * @return OSTRESS_SUCCESS or OSTRESS_ERR_BACKEND
     */
    virtual ostress_status_t
    putObject(std::string_view bucket,
              std::string_view key,
              const char *data,
              size_t data_len,
              std::string &error) = 0;
};

#endif
