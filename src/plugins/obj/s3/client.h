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

#ifndef OSTRESS_PLUGIN_S3_CLIENT_H
#define OSTRESS_PLUGIN_S3_CLIENT_H

#include <memory>
#include <string>
#include <string_view>
#include <aws/s3/S3Client.h>
#include <aws/core/Aws.h>
#include "ostress_obj_client.h"
#include "ostress_params.h"

/**
 * Concrete implementation of iObjClient using the AWS SDK S3Client.
 * Calls are synchronous; the SDK client is safe to share between workers.
 */
class awsS3Client : public iObjClient {
public:
    /**
     * Constructor that creates an AWS S3Client from connection parameters.
     * Path-style addressing is used unless virtual addressing is requested,
     * as most S3-compatible stores expect it.
     * @param params Endpoint, region, scheme, TLS and credential settings
     */
    explicit awsS3Client(const ostressS3Params &params);

    ostress_status_t
    getObject(std::string_view bucket,
              std::string_view key,
              std::unique_ptr<iObjBody> &body,
              std::string &error) override;

    ostress_status_t
    putObject(std::string_view bucket,
              std::string_view key,
              const char *data,
              size_t data_len,
              std::string &error) override;

private:
    std::unique_ptr<Aws::S3::S3Client> s3Client_;
};

#endif // OSTRESS_PLUGIN_S3_CLIENT_H
