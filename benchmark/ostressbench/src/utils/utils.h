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
#ifndef __OSTRESSBENCH_UTILS_H
#define __OSTRESSBENCH_UTILS_H

#include <string>
#include "ostress_params.h"

class ostressBenchConfig {
public:
    /**
     * Apply explicitly given command-line flags on top of cfg and take the
     * manifest path from the single positional argument.
     * @return 0 on success, -1 on a usage error
     */
    static int
    loadFromFlags(ostressRunConfig &cfg, int argc, char *argv[]);

    static void
    printConfig(const ostressRunConfig &cfg);

    static void
    printOption(const std::string &desc, const std::string &value);

    static void
    printSeparator(const char sep);
};

#endif
