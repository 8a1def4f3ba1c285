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

#ifndef OSTRESS_AWS_SDK_INIT_H
#define OSTRESS_AWS_SDK_INIT_H

#include <aws/core/Aws.h>
#include <mutex>
#include <cstdlib>
#include "common/ostress_log.h"

namespace ostress_s3_utils {

/**
 * Initialize the AWS SDK once per process, however many stress runs
 * construct a client. Connections torn down by the store under load must
 * not kill the process, so the SDK installs its SIGPIPE handler.
 *
 * The AWS SDK is shut down at program exit via std::atexit.
 */
inline void
initAWSSDK() {
    static std::once_flag aws_init_flag;
    static Aws::SDKOptions *aws_options = nullptr;

    std::call_once(aws_init_flag, []() {
        aws_options = new Aws::SDKOptions();
        aws_options->httpOptions.installSigPipeHandler = true;
        Aws::InitAPI(*aws_options);
        OSTRESS_DEBUG << "AWS SDK initialized";

        std::atexit([]() {
            Aws::ShutdownAPI(*aws_options);
            delete aws_options;
        });
    });
}

} // namespace ostress_s3_utils

#endif // OSTRESS_AWS_SDK_INIT_H
