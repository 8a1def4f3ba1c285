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
#include "ostress_params.h"

#include <absl/strings/ascii.h>

#include "common/configuration.h"
#include "common/ostress_log.h"
#include "duration.h"

namespace {

void
overrideString(std::string &value, const std::string &env) {
    const auto opt = ostress::config::getenvOptional(env);
    if (opt && !opt->empty()) {
        value = *opt;
    }
}

bool
isLogLevel(const std::string &level) {
    const std::string lower = absl::AsciiStrToLower(level);
    return lower == "debug" || lower == "info" || lower == "warn" || lower == "error";
}

} // namespace

ostressRunConfig
ostressRunConfig::fromEnv() {
    using ostress::config::overrideFromEnv;

    ostressRunConfig cfg;

    overrideString(cfg.s3.endpoint, "AWS_ENDPOINT_URL");
    overrideString(cfg.s3.region, "AWS_REGION");
    overrideString(cfg.s3.bucket, "S3_BUCKET");
    overrideString(cfg.s3.accessKey, "AWS_ACCESS_KEY_ID");
    overrideString(cfg.s3.secretKey, "AWS_SECRET_ACCESS_KEY");
    overrideString(cfg.s3.sessionToken, "AWS_SESSION_TOKEN");

    overrideFromEnv(cfg.s3.insecureSkipVerify, "OSTRESS_INSECURE_SKIP_VERIFY");
    overrideFromEnv(cfg.opType, "OSTRESS_OPERATION_TYPE", [](const std::string &value) {
        ostress_mode_t mode;
        return ostressEnumStrings::parseMode(value, mode) == OSTRESS_SUCCESS;
    });
    overrideFromEnv(cfg.putSizeKB, "OSTRESS_PUT_SIZE_KB", [](int value) { return value > 0; });
    overrideFromEnv(cfg.fileCount, "OSTRESS_FILE_COUNT", [](int value) { return value >= 0; });
    overrideFromEnv(cfg.generateManifest, "OSTRESS_GENERATE_MANIFEST");
    overrideFromEnv(cfg.logLevel, ostressLogLevelVar, isLogLevel);

    cfg.opType = absl::AsciiStrToLower(cfg.opType);
    cfg.logLevel = absl::AsciiStrToLower(cfg.logLevel);
    return cfg;
}

ostress_status_t
ostressRunConfig::validate(std::string &err_msg) {
    if (duration.empty()) {
        err_msg = "duration (--duration) is required";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    ostress_duration_t parsed_duration;
    if (ostressParseDuration(duration, parsed_duration) != OSTRESS_SUCCESS) {
        err_msg = "invalid duration (--duration): " + duration;
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (concurrency <= 0) {
        err_msg = "concurrency (--concurrency) must be greater than 0";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (manifestPath.empty()) {
        err_msg = "manifest file path argument is required";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (outputFile.empty()) {
        err_msg = "output csv file path (--output) is required";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    ostress_mode_t parsed;
    if (ostressEnumStrings::parseMode(opType, parsed) != OSTRESS_SUCCESS) {
        err_msg = "invalid operation type (--op_type): " + opType +
            ". Must be 'read', 'write', or 'mixed'";
        return OSTRESS_ERR_INVALID_PARAM;
    }
    opType = ostressEnumStrings::modeStr(parsed);
    validatedOpType_ = opType;
    validatedMode_ = parsed;

    if (parsed != ostress_mode_t::READ && putSizeKB <= 0) {
        err_msg = "put object size (--put_size_kb) must be greater than 0 KB for 'write' or "
                  "'mixed' mode";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (fileCount < 0) {
        err_msg = "file count (--num_files) must not be negative";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (s3.endpoint.empty()) {
        err_msg = "endpoint URL is required (--endpoint or AWS_ENDPOINT_URL)";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    if (s3.bucket.empty()) {
        err_msg = "bucket name is required (--bucket or S3_BUCKET)";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    return OSTRESS_SUCCESS;
}

ostress_mode_t
ostressRunConfig::mode() const {
    if (!validatedOpType_.empty() && opType == validatedOpType_) {
        return validatedMode_;
    }

    // Unknown types are reported by validate()
    ostress_mode_t parsed;
    if (ostressEnumStrings::parseMode(opType, parsed) != OSTRESS_SUCCESS) {
        return ostress_mode_t::READ;
    }
    return parsed;
}
