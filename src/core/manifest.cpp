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
#include "manifest.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>

#include "common/ostress_log.h"

ostress_status_t
ostressParseManifest(std::istream &input, std::vector<std::string> &keys) {
    std::vector<std::string> loaded;
    std::string line;

    while (std::getline(input, line)) {
        const auto trimmed = absl::StripAsciiWhitespace(line);
        if (!trimmed.empty()) {
            loaded.emplace_back(trimmed);
        }
    }

    if (input.bad()) {
        OSTRESS_ERROR << "Error reading manifest after " << loaded.size() << " keys";
        return OSTRESS_ERR_BACKEND;
    }

    if (loaded.empty()) {
        OSTRESS_ERROR << "Manifest is empty or contains no valid keys";
        return OSTRESS_ERR_INVALID_PARAM;
    }

    keys = std::move(loaded);
    return OSTRESS_SUCCESS;
}

ostress_status_t
ostressLoadManifest(const std::string &path, std::vector<std::string> &keys) {
    std::ifstream file(path);
    if (!file.is_open()) {
        OSTRESS_ERROR << "Failed to open manifest file " << path << ": " << std::strerror(errno);
        return OSTRESS_ERR_NOT_FOUND;
    }

    const ostress_status_t status = ostressParseManifest(file, keys);
    if (status != OSTRESS_SUCCESS) {
        OSTRESS_ERROR << "Manifest file " << path << " could not be loaded";
        return status;
    }

    OSTRESS_DEBUG << "Loaded " << keys.size() << " keys from " << path;
    return OSTRESS_SUCCESS;
}

ostressManifestWriter::ostressManifestWriter(const std::string &path)
    : path_(path),
      fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)) {
    if (fd_ < 0) {
        throw std::runtime_error(absl::StrFormat(
            "Failed to create manifest file %s: %s", path, std::strerror(errno)));
    }
}

ostressManifestWriter::~ostressManifestWriter() {
    if (close() != OSTRESS_SUCCESS) {
        OSTRESS_ERROR << "Manifest " << path_ << " was not closed cleanly";
    }
}

ostress_status_t
ostressManifestWriter::addKey(const std::string &key) {
    const std::string line = key + "\n";
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        OSTRESS_ERROR << "Cannot append key " << key << " to closed manifest " << path_;
        return OSTRESS_ERR_NOT_ALLOWED;
    }

    size_t written = 0;
    while (written < line.size()) {
        const ssize_t rc = ::write(fd_, line.data() + written, line.size() - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            OSTRESS_ERROR << "Failed to write key to manifest " << path_ << ": "
                          << std::strerror(errno);
            return OSTRESS_ERR_BACKEND;
        }
        written += static_cast<size_t>(rc);
    }
    return OSTRESS_SUCCESS;
}

ostress_status_t
ostressManifestWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return OSTRESS_SUCCESS;
    }

    ostress_status_t status = OSTRESS_SUCCESS;
    if (::fsync(fd_) != 0) {
        OSTRESS_ERROR << "Failed to flush manifest " << path_ << ": " << std::strerror(errno);
        status = OSTRESS_ERR_BACKEND;
    }

    if (::close(fd_) != 0) {
        OSTRESS_ERROR << "Failed to close manifest " << path_ << ": " << std::strerror(errno);
        status = OSTRESS_ERR_BACKEND;
    }
    fd_ = -1;
    return status;
}
