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
#ifndef _OSTRESS_PARAMS_H
#define _OSTRESS_PARAMS_H

#include <string>
#include "ostress_types.h"

constexpr const char *OSTRESS_DEFAULT_DURATION = "1m";
constexpr int OSTRESS_DEFAULT_CONCURRENCY = 10;
constexpr const char *OSTRESS_DEFAULT_OP_TYPE = "read";
constexpr int OSTRESS_DEFAULT_PUT_SIZE_KB = 1024;
constexpr int OSTRESS_DEFAULT_FILE_COUNT = 0;
constexpr const char *OSTRESS_DEFAULT_REGION = "us-east-1";
constexpr const char *OSTRESS_DEFAULT_OUTPUT = "stress_results.csv";
constexpr const char *OSTRESS_DEFAULT_LOG_LEVEL = "info";

/**
 * @struct ostressS3Params
 * @brief  Connection settings handed to the object-store client.
 *         Empty credentials select the SDK default credential chain.
 */
struct ostressS3Params {
    std::string endpoint;
    std::string region = OSTRESS_DEFAULT_REGION;
    std::string bucket;
    std::string accessKey;
    std::string secretKey;
    std::string sessionToken;
    /** @var "http", "https" or empty to let the SDK decide */
    std::string scheme;
    std::string caBundle;
    bool insecureSkipVerify = false;
    bool useVirtualAddressing = false;
};

/**
 * @struct ostressRunConfig
 * @brief  Complete description of one stress run. Immutable once the
 *         run has started.
 */
struct ostressRunConfig {
    ostressS3Params s3;

    /** @var Run length with unit suffixes, e.g. "30s", "5m", "1h30m" */
    std::string duration = OSTRESS_DEFAULT_DURATION;
    int concurrency = OSTRESS_DEFAULT_CONCURRENCY;
    /** @var "read", "write" or "mixed"; normalized by validate() */
    std::string opType = OSTRESS_DEFAULT_OP_TYPE;
    bool randomize = false;
    int putSizeKB = OSTRESS_DEFAULT_PUT_SIZE_KB;
    /** @var Number of objects to create in write mode, 0 for a timed run */
    int fileCount = OSTRESS_DEFAULT_FILE_COUNT;
    bool generateManifest = true;
    std::string manifestPath;
    std::string outputFile = OSTRESS_DEFAULT_OUTPUT;
    std::string logLevel = OSTRESS_DEFAULT_LOG_LEVEL;

    /**
     * @brief Start from defaults and apply the environment overrides.
     *        Invalid environment values are logged and ignored.
     */
    static ostressRunConfig
    fromEnv();

    /**
     * @brief Check the final configuration, normalize the op type and
     *        remember the parsed mode.
     *
     * @param err_msg [out] Reason of the first rejected field
     */
    ostress_status_t
    validate(std::string &err_msg);

    /** @brief Mode named by opType, READ when it is unknown */
    ostress_mode_t
    mode() const;

    size_t
    putSizeBytes() const {
        return static_cast<size_t>(putSizeKB) * 1024;
    }

    bool
    isFixedCount() const {
        return mode() == ostress_mode_t::WRITE && fileCount > 0;
    }

private:
    std::string validatedOpType_;
    ostress_mode_t validatedMode_ = ostress_mode_t::READ;
};

#endif
