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

#include "client.h"
#include "object/s3/utils.h"
#include "object/s3/aws_sdk_init.h"
#include "common/ostress_log.h"
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <absl/strings/str_format.h>

namespace {

template<typename errorType>
std::string
describeError(const errorType &err) {
    return absl::StrFormat("%s: %s (HTTP %d)",
                           err.GetExceptionName(),
                           err.GetMessage(),
                           static_cast<int>(err.GetResponseCode()));
}

class awsS3Body : public iObjBody {
public:
    explicit awsS3Body(Aws::S3::Model::GetObjectResult result)
        : result_(std::move(result)),
          expected_(result_.GetContentLength()) {}

    ostress_status_t
    read(char *buf, size_t len, size_t &bytes_read, std::string &error) override {
        auto &stream = result_.GetBody();
        stream.read(buf, static_cast<std::streamsize>(len));
        bytes_read = static_cast<size_t>(stream.gcount());
        consumed_ += bytes_read;

        if (stream.bad()) {
            error = absl::StrFormat("stream failure after %d bytes", consumed_);
            return OSTRESS_ERR_BACKEND;
        }

        if (bytes_read == 0 && expected_ >= 0 && consumed_ < static_cast<uint64_t>(expected_)) {
            error = absl::StrFormat(
                "body truncated: got %d of %d bytes", consumed_, static_cast<int64_t>(expected_));
            return OSTRESS_ERR_BACKEND;
        }
        return OSTRESS_SUCCESS;
    }

private:
    Aws::S3::Model::GetObjectResult result_;
    const long long expected_;
    uint64_t consumed_ = 0;
};

} // namespace

awsS3Client::awsS3Client(const ostressS3Params &params) {
    // Initialize AWS SDK (thread-safe, only happens once)
    ostress_s3_utils::initAWSSDK();

    Aws::Client::ClientConfiguration config;
    ostress_s3_utils::configureClient(config, params);

    auto credentials_opt = ostress_s3_utils::createAWSCredentials(params);

    if (credentials_opt.has_value()) {
        OSTRESS_INFO << "Using static credentials provided in configuration";
        s3Client_ = std::make_unique<Aws::S3::S3Client>(
            credentials_opt.value(),
            config,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::RequestDependent,
            params.useVirtualAddressing);
    } else {
        OSTRESS_INFO << "Using default AWS credential chain";
        s3Client_ = std::make_unique<Aws::S3::S3Client>(
            config,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::RequestDependent,
            params.useVirtualAddressing);
    }

    OSTRESS_INFO << "S3 client created for endpoint '" << params.endpoint << "', region '"
                 << params.region << "'";
}

ostress_status_t
awsS3Client::getObject(std::string_view bucket,
                       std::string_view key,
                       std::unique_ptr<iObjBody> &body,
                       std::string &error) {
    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(Aws::String(bucket)).WithKey(Aws::String(key));

    auto outcome = s3Client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        error = describeError(outcome.GetError());
        return OSTRESS_ERR_BACKEND;
    }

    body = std::make_unique<awsS3Body>(outcome.GetResultWithOwnership());
    return OSTRESS_SUCCESS;
}

ostress_status_t
awsS3Client::putObject(std::string_view bucket,
                       std::string_view key,
                       const char *data,
                       size_t data_len,
                       std::string &error) {
    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(Aws::String(bucket)).WithKey(Aws::String(key));

    // The SDK only reads from the stream, the payload is never modified
    auto preallocated_stream_buf = Aws::MakeShared<Aws::Utils::Stream::PreallocatedStreamBuf>(
        "PutObjectStreamBuf",
        reinterpret_cast<unsigned char *>(const_cast<char *>(data)),
        data_len);
    auto data_stream =
        Aws::MakeShared<Aws::IOStream>("PutObjectInputStream", preallocated_stream_buf.get());
    request.SetBody(data_stream);
    request.SetContentLength(static_cast<long long>(data_len));
    request.SetContentType("application/octet-stream");

    auto outcome = s3Client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        error = describeError(outcome.GetError());
        return OSTRESS_ERR_BACKEND;
    }
    return OSTRESS_SUCCESS;
}
