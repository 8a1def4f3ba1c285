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

#ifndef OSTRESS_S3_UTILS_H
#define OSTRESS_S3_UTILS_H

#include <optional>
#include <string>
#include <aws/core/http/Scheme.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include "ostress_params.h"

namespace ostress_s3_utils {

/**
 * Create AWS credentials from the connection parameters.
 * Returns nullopt if access_key or secret_key are not provided, which
 * leaves the SDK default credential chain in charge.
 */
std::optional<Aws::Auth::AWSCredentials>
createAWSCredentials(const ostressS3Params &params);

/**
 * Fill endpoint, scheme, region, TLS verification and CA bundle settings.
 * Throws runtime_error for an unknown scheme.
 */
void
configureClient(Aws::Client::ClientConfiguration &config, const ostressS3Params &params);

/**
 * Bucket from the parameters or the S3_BUCKET env var.
 * Throws runtime_error if the bucket cannot be determined.
 */
std::string
getBucketName(const ostressS3Params &params);

} // namespace ostress_s3_utils

#endif // OSTRESS_S3_UTILS_H
