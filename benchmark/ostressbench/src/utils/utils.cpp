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

#include <iomanip>
#include <iostream>

#include <gflags/gflags.h>

DEFINE_string(duration,
              OSTRESS_DEFAULT_DURATION,
              "Duration of the test, e.g. 30s, 5m, 1h30m (ignored with --num_files)");
DEFINE_int32(concurrency, OSTRESS_DEFAULT_CONCURRENCY, "Number of concurrent workers");
DEFINE_bool(randomize, false, "Pick keys randomly instead of sequentially for GETs");
DEFINE_string(op_type, OSTRESS_DEFAULT_OP_TYPE, "Operation type: read, write, mixed");
DEFINE_int32(put_size_kb,
             OSTRESS_DEFAULT_PUT_SIZE_KB,
             "Size of uploaded objects in KiB (write and mixed modes)");
DEFINE_int32(num_files,
             OSTRESS_DEFAULT_FILE_COUNT,
             "Number of objects to create in write mode, 0 to write until --duration expires");
DEFINE_bool(gen_manifest, true, "Record created keys in the manifest file (write mode)");
DEFINE_string(output, OSTRESS_DEFAULT_OUTPUT, "Output CSV file for detailed results");
DEFINE_string(log_level, OSTRESS_DEFAULT_LOG_LEVEL, "Log level: debug, info, warn, error");

// S3 connection
DEFINE_string(endpoint, "", "S3 endpoint URL (env AWS_ENDPOINT_URL)");
DEFINE_string(region, OSTRESS_DEFAULT_REGION, "S3 region (env AWS_REGION)");
DEFINE_string(bucket, "", "S3 bucket name (env S3_BUCKET)");
DEFINE_string(access_key, "", "Access key (env AWS_ACCESS_KEY_ID)");
DEFINE_string(secret_key, "", "Secret key (env AWS_SECRET_ACCESS_KEY)");
DEFINE_string(session_token, "", "Session token (env AWS_SESSION_TOKEN)");
DEFINE_string(scheme, "", "HTTP scheme [http, https], derived from the endpoint when empty");
DEFINE_bool(insecure_skip_verify, false, "Skip TLS certificate verification");
DEFINE_string(ca_bundle, "", "Path to a CA bundle for TLS verification");
DEFINE_bool(use_virtual_addressing, false, "Use virtual-hosted style bucket addressing");

namespace {

bool
isSet(const char *name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

template<typename T>
void
applyFlag(const char *name, T &target, const T &value) {
    if (isSet(name)) target = value;
}

std::string
boolStr(bool value) {
    return value ? "true" : "false";
}

std::string
maskSecret(const std::string &secret) {
    return secret.empty() ? "<not set>" : "<set>";
}

} // namespace

int
ostressBenchConfig::loadFromFlags(ostressRunConfig &cfg, int argc, char *argv[]) {
    applyFlag("duration", cfg.duration, FLAGS_duration);
    applyFlag("concurrency", cfg.concurrency, FLAGS_concurrency);
    applyFlag("randomize", cfg.randomize, FLAGS_randomize);
    applyFlag("op_type", cfg.opType, FLAGS_op_type);
    applyFlag("put_size_kb", cfg.putSizeKB, FLAGS_put_size_kb);
    applyFlag("num_files", cfg.fileCount, FLAGS_num_files);
    applyFlag("gen_manifest", cfg.generateManifest, FLAGS_gen_manifest);
    applyFlag("output", cfg.outputFile, FLAGS_output);
    applyFlag("log_level", cfg.logLevel, FLAGS_log_level);

    applyFlag("endpoint", cfg.s3.endpoint, FLAGS_endpoint);
    applyFlag("region", cfg.s3.region, FLAGS_region);
    applyFlag("bucket", cfg.s3.bucket, FLAGS_bucket);
    applyFlag("access_key", cfg.s3.accessKey, FLAGS_access_key);
    applyFlag("secret_key", cfg.s3.secretKey, FLAGS_secret_key);
    applyFlag("session_token", cfg.s3.sessionToken, FLAGS_session_token);
    applyFlag("scheme", cfg.s3.scheme, FLAGS_scheme);
    applyFlag("insecure_skip_verify", cfg.s3.insecureSkipVerify, FLAGS_insecure_skip_verify);
    applyFlag("ca_bundle", cfg.s3.caBundle, FLAGS_ca_bundle);
    applyFlag("use_virtual_addressing", cfg.s3.useVirtualAddressing, FLAGS_use_virtual_addressing);

    if (argc != 2) {
        std::cerr << "Error: exactly one manifest file path argument is required, got "
                  << argc - 1 << std::endl;
        return -1;
    }
    cfg.manifestPath = argv[1];
    return 0;
}

void
ostressBenchConfig::printOption(const std::string &desc, const std::string &value) {
    std::cout << std::left << std::setw(50) << desc << ": " << value << std::endl;
}

void
ostressBenchConfig::printSeparator(const char sep) {
    std::cout << std::string(100, sep) << std::endl;
}

void
ostressBenchConfig::printConfig(const ostressRunConfig &cfg) {
    printSeparator('*');
    std::cout << "OStressBench Configuration" << std::endl;
    printSeparator('*');
    printOption("Endpoint (--endpoint)", cfg.s3.endpoint);
    printOption("Region (--region)", cfg.s3.region);
    printOption("Bucket (--bucket)", cfg.s3.bucket);
    printOption("Scheme (--scheme=[http,https])", cfg.s3.scheme.empty() ? "auto" : cfg.s3.scheme);
    printOption("Access key (--access_key)", maskSecret(cfg.s3.accessKey));
    printOption("Skip TLS verify (--insecure_skip_verify)", boolStr(cfg.s3.insecureSkipVerify));
    if (!cfg.s3.caBundle.empty()) {
        printOption("CA bundle (--ca_bundle)", cfg.s3.caBundle);
    }
    printOption("Virtual addressing (--use_virtual_addressing)",
                boolStr(cfg.s3.useVirtualAddressing));
    printSeparator('-');
    printOption("Op type (--op_type=[read,write,mixed])", cfg.opType);
    if (cfg.isFixedCount()) {
        printOption("Number of files (--num_files=N)", std::to_string(cfg.fileCount));
    } else {
        printOption("Duration (--duration)", cfg.duration);
    }
    printOption("Concurrency (--concurrency=N)", std::to_string(cfg.concurrency));
    if (cfg.mode() != ostress_mode_t::WRITE) {
        printOption("Randomize keys (--randomize)", boolStr(cfg.randomize));
    }
    if (cfg.mode() != ostress_mode_t::READ) {
        printOption("Put size KiB (--put_size_kb=N)", std::to_string(cfg.putSizeKB));
    }
    if (cfg.mode() == ostress_mode_t::WRITE) {
        printOption("Generate manifest (--gen_manifest)", boolStr(cfg.generateManifest));
    }
    printOption("Manifest", cfg.manifestPath);
    printOption("Output CSV (--output)", cfg.outputFile);
    printSeparator('*');
}
