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
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

#include <gflags/gflags.h>

#include "ostress.h"
#include "ostress_report.h"
#include "common/ostress_log.h"
#include "utils/utils.h"

namespace {

ostressRunContext *rootContext = nullptr;
volatile std::sig_atomic_t interrupts = 0;

void
signalHandler(int signal) {
    static const char msg[] = "Interrupt received, stopping workers...\n";
    constexpr int stderr_fd = 2;
    constexpr int max_count = 1;
    auto size = write(stderr_fd, msg, sizeof(msg) - 1);
    (void)size;

    if (++interrupts > max_count) {
        std::_Exit(EXIT_FAILURE);
    }
    if (rootContext) {
        rootContext->cancel();
    }
}

} // namespace

int
main(int argc, char *argv[]) {
    gflags::SetUsageMessage("ostressbench [flags] <manifest-file>\n\n"
                            "Drives GET/PUT load against an S3 compatible object store.\n"
                            "read and mixed modes read keys from the manifest file, write mode\n"
                            "records created keys into it.");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    ostressLogInit(ostressLogLevelFromEnv(OSTRESS_DEFAULT_LOG_LEVEL));

    ostressRunConfig cfg = ostressRunConfig::fromEnv();
    if (ostressBenchConfig::loadFromFlags(cfg, argc, argv) != 0) {
        gflags::ShowUsageWithFlagsRestrict(argv[0], "ostressbench");
        return EXIT_FAILURE;
    }
    ostressLogInit(cfg.logLevel);

    std::string err_msg;
    if (cfg.validate(err_msg) != OSTRESS_SUCCESS) {
        std::cerr << "Error: invalid configuration: " << err_msg << std::endl;
        return EXIT_FAILURE;
    }

    ostressBenchConfig::printConfig(cfg);

    ostressRunContext root;
    rootContext = &root;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::vector<ostressResult> results;
    ostressStats stats(cfg.concurrency);
    const ostress_status_t status = ostressRunStressTest(root, cfg, results, stats);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    rootContext = nullptr;

    if (status != OSTRESS_SUCCESS) {
        std::cerr << "Error: stress test failed: " << ostressEnumStrings::statusStr(status)
                  << std::endl;
        return EXIT_FAILURE;
    }

    if (root.isDone()) {
        OSTRESS_INFO << "Run interrupted, reporting partial results";
    }

    ostressPrintSummary(stats, std::cout);

    if (results.empty()) {
        OSTRESS_WARN << "No results were collected, skipping " << cfg.outputFile;
    } else if (ostressWriteResultsCsv(results, cfg.outputFile) != OSTRESS_SUCCESS) {
        OSTRESS_ERROR << "Failed to write detailed results to " << cfg.outputFile;
    }

    gflags::ShutDownCommandLineFlags();
    return EXIT_SUCCESS;
}
