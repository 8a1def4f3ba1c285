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
#ifndef OSTRESS_SRC_CORE_EXECUTOR_H
#define OSTRESS_SRC_CORE_EXECUTOR_H

#include <string>
#include "ostress_obj_client.h"
#include "ostress_stats.h"

/** @brief Chunk size used to drain GET bodies */
constexpr size_t OSTRESS_GET_CHUNK_SIZE = 64 * 1024;

/**
 * @brief Download one object and time it.
 *
 * TTFB is taken when the store answered the request, TTLB once the whole
 * body was consumed. A failed request leaves both unmeasured. A body that
 * fails midway keeps TTFB, sets TTLB to the failure instant, reports the
 * bytes received so far and an error prefixed with "body read error: ".
 */
ostressResult
ostressPerformGet(iObjClient &client, const std::string &bucket, const std::string &key);

/**
 * @brief Upload one object and time the call. TTFB is never measured for a
 *        PUT; TTLB covers the whole call. A failed upload reports zero
 *        uploaded bytes.
 */
ostressResult
ostressPerformPut(iObjClient &client,
                  const std::string &bucket,
                  const std::string &key,
                  const char *data,
                  size_t size);

#endif
