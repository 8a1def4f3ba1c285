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

#include "utils.h"

#include <cstdlib>
#include <stdexcept>
#include "common/ostress_log.h"

namespace ostress_s3_utils {

std::optional<Aws::Auth::AWSCredentials>
createAWSCredentials(const ostressS3Params &params) {
    if (params.accessKey.empty() || params.secretKey.empty()) return std::nullopt;

    if (params.sessionToken.empty())
        return Aws::Auth::AWSCredentials(params.accessKey, params.secretKey);

    return Aws::Auth::AWSCredentials(params.accessKey, params.secretKey, params.sessionToken);
}

void
configureClient(Aws::Client::ClientConfiguration &config, const ostressS3Params &params) {
    if (!params.endpoint.empty()) config.endpointOverride = params.endpoint;

    if (!params.scheme.empty()) {
        if (params.scheme == "http")
            config.scheme = Aws::Http::Scheme::HTTP;
        else if (params.scheme == "https")
            config.scheme = Aws::Http::Scheme::HTTPS;
        else
            throw std::runtime_error("Invalid scheme: " + params.scheme);
    }

    if (!params.region.empty()) config.region = params.region;

    if (!params.caBundle.empty()) config.caFile = params.caBundle;

    if (params.insecureSkipVerify) {
        OSTRESS_WARN << "Disabling TLS certificate verification for S3 client";
        config.verifySSL = false;
    }
}

std::string
getBucketName(const ostressS3Params &params) {
    if (!params.bucket.empty()) return params.bucket;

    const char *env_bucket = std::getenv("S3_BUCKET");
    if (env_bucket && env_bucket[0] != '\0') return std::string(env_bucket);

    throw std::runtime_error("Bucket name not found. Please provide a bucket or "
                             "set the S3_BUCKET environment variable");
}

} // namespace ostress_s3_utils
