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
#include "common.h"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "absl/log/globals.h"
#include "absl/log/log_sink_registry.h"

namespace gtest {

void
ScopedEnv::addVar(const std::string &name, const std::string &value) {
    m_vars.emplace(name, value);
}

void
ScopedEnv::popVar() {
    m_vars.pop();
}

ScopedEnv::Variable::Variable(const std::string &name, const std::string &value)
    : m_name(name) {
    const char *backup = getenv(name.c_str());

    if (backup != nullptr) {
        m_prev_value = backup;
    }

    setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnv::Variable::Variable(Variable &&other)
    : m_prev_value(std::move(other.m_prev_value)),
      m_name(std::move(other.m_name)) {
    other.m_name.clear();
}

ScopedEnv::Variable::~Variable() {
    if (m_name.empty()) {
        return;
    }

    if (m_prev_value) {
        setenv(m_name.c_str(), m_prev_value->c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}

ScopedUnsetEnv::ScopedUnsetEnv(const std::string &name) : m_name(name) {
    if (const char *backup = getenv(name.c_str())) {
        m_prev_value = backup;
    }
    unsetenv(name.c_str());
}

ScopedUnsetEnv::~ScopedUnsetEnv() {
    if (m_prev_value) {
        setenv(m_name.c_str(), m_prev_value->c_str(), 1);
    }
}

scopedTestLogSink::scopedTestLogSink() {
    absl::AddLogSink(&sink_);
}

scopedTestLogSink::~scopedTestLogSink() {
    absl::RemoveLogSink(&sink_);
}

size_t
scopedTestLogSink::warningCount() const {
    std::lock_guard<std::mutex> lock(sink_.mutex_);
    return sink_.warnings_.size();
}

size_t
scopedTestLogSink::countWarningsMatching(const std::string &substring) const {
    std::lock_guard<std::mutex> lock(sink_.mutex_);
    size_t count = 0;
    for (const auto &msg : sink_.warnings_) {
        if (msg.find(substring) != std::string::npos) {
            count++;
        }
    }
    return count;
}

void
scopedTestLogSink::testLogSink::Send(const absl::LogEntry &entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.log_severity() == absl::LogSeverity::kWarning) {
        warnings_.emplace_back(entry.text_message());
    } else if (entry.verbosity() != absl::LogEntry::kNoVerbosityLevel) {
        debug_.emplace_back(entry.text_message());
    }
}

size_t
scopedTestLogSink::countDebugMatching(const std::string &substring) const {
    std::lock_guard<std::mutex> lock(sink_.mutex_);
    size_t count = 0;
    for (const auto &msg : sink_.debug_) {
        if (msg.find(substring) != std::string::npos) {
            count++;
        }
    }
    return count;
}

scopedDebugLogging::scopedDebugLogging()
    : prevMinLevel_(absl::MinLogLevel()),
      prevVerbosity_(absl::SetGlobalVLogThreshold(1)) {
    absl::SetMinLogLevel(absl::LogSeverityAtLeast::kInfo);
}

scopedDebugLogging::~scopedDebugLogging() {
    absl::SetGlobalVLogThreshold(prevVerbosity_);
    absl::SetMinLogLevel(prevMinLevel_);
}

namespace {
    std::atomic<unsigned> temp_counter{0};
} // namespace

scopedTempFile::scopedTempFile(const std::string &name) {
    std::ostringstream oss;
    oss << testing::TempDir() << "ostress_" << getpid() << "_" << temp_counter++ << "_" << name;
    path_ = oss.str();
    std::remove(path_.c_str());
}

scopedTempFile::~scopedTempFile() {
    std::remove(path_.c_str());
}

void
scopedTempFile::write(const std::string &content) const {
    std::ofstream file(path_, std::ios::out | std::ios::trunc);
    file << content;
}

std::string
scopedTempFile::read() const {
    std::ifstream file(path_);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace gtest
