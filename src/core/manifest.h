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
#ifndef OSTRESS_SRC_CORE_MANIFEST_H
#define OSTRESS_SRC_CORE_MANIFEST_H

#include <istream>
#include <mutex>
#include <string>
#include <vector>
#include "ostress_types.h"

/**
 * @brief Load object keys, one per line. Keys are trimmed; blank and
 *        whitespace-only lines are skipped. Order is preserved and
 *        duplicates are kept.
 *
 * @return OSTRESS_ERR_NOT_FOUND if the file cannot be opened,
 *         OSTRESS_ERR_BACKEND on a read failure,
 *         OSTRESS_ERR_INVALID_PARAM if no usable key remains
 */
ostress_status_t
ostressLoadManifest(const std::string &path, std::vector<std::string> &keys);

/**
 * @brief Same as ostressLoadManifest() over an already open stream.
 */
ostress_status_t
ostressParseManifest(std::istream &input, std::vector<std::string> &keys);

/**
 * @class ostressManifestWriter
 * @brief Records keys of created objects, one per line.
 *
 * The target file is truncated on construction. addKey() may be called
 * concurrently from many workers; appends are serialized so each key lands
 * on its own line, in completion order. Entries are durable once close()
 * succeeded.
 */
class ostressManifestWriter {
public:
    /**
     * @throws std::runtime_error if the file cannot be created
     */
    explicit ostressManifestWriter(const std::string &path);
    ~ostressManifestWriter();

    ostressManifestWriter(const ostressManifestWriter &) = delete;
    ostressManifestWriter &
    operator=(const ostressManifestWriter &) = delete;

    ostress_status_t
    addKey(const std::string &key);

    /**
     * @brief Flush to stable storage and close. Later calls are no-ops.
     */
    ostress_status_t
    close();

    const std::string &
    path() const {
        return path_;
    }

private:
    std::string path_;
    std::mutex mutex_;
    int fd_;
};

#endif
