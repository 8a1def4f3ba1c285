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
#ifndef TEST_GTEST_COMMON_H
#define TEST_GTEST_COMMON_H

#include <mutex>
#include <optional>
#include <stack>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_entry.h"
#include "absl/base/log_severity.h"

namespace gtest {

class ScopedEnv {
public:
    void
    addVar(const std::string &name, const std::string &value);
    void
    popVar();

private:
    class Variable {
    public:
        Variable(const std::string &name, const std::string &value);
        Variable(Variable &&other);
        ~Variable();

        Variable(const Variable &other) = delete;
        Variable &operator=(const Variable &other) = delete;

    private:
        std::optional<std::string> m_prev_value;
        std::string m_name;
    };

    std::stack<Variable> m_vars;
};

/**
 * @brief Removes the named variable for the lifetime of the guard and
 *        restores its previous value afterwards.
 */
class ScopedUnsetEnv {
public:
    explicit ScopedUnsetEnv(const std::string &name);
    ~ScopedUnsetEnv();

    ScopedUnsetEnv(const ScopedUnsetEnv &) = delete;
    ScopedUnsetEnv &operator=(const ScopedUnsetEnv &) = delete;

private:
    std::string m_name;
    std::optional<std::string> m_prev_value;
};

/**
 * @brief A scoped LogSink that captures log messages for testing assertions.
 *
 * This class registers itself with Abseil's logging system to intercept
 * log messages on construction and unregisters on destruction. It can be
 * used in tests to verify that expected warnings or errors are logged.
 *
 * Usage:
 *   scopedTestLogSink sink;
 *   // ... code that logs warnings ...
 *   EXPECT_EQ(sink.warningCount(), 1);
 *   EXPECT_EQ(sink.countWarningsMatching("expected message"), 1);
 */
class scopedTestLogSink {
public:
    scopedTestLogSink();
    ~scopedTestLogSink();

    scopedTestLogSink(const scopedTestLogSink &) = delete;
    scopedTestLogSink &
    operator=(const scopedTestLogSink &) = delete;

    [[nodiscard]] size_t
    warningCount() const;

    [[nodiscard]] size_t
    countWarningsMatching(const std::string &substring) const;

    /** @brief Count of captured OSTRESS_DEBUG/TRACE messages containing @p substring */
    [[nodiscard]] size_t
    countDebugMatching(const std::string &substring) const;

private:
    class testLogSink : public absl::LogSink {
    public:
        void
        Send(const absl::LogEntry &entry) override;

        mutable std::mutex mutex_;
        std::vector<std::string> warnings_;
        std::vector<std::string> debug_;
    };

    testLogSink sink_;
};

/**
 * @brief Lets OSTRESS_DEBUG messages reach the log sinks while in scope,
 *        without echoing them to stderr.
 */
class scopedDebugLogging {
public:
    scopedDebugLogging();
    ~scopedDebugLogging();

    scopedDebugLogging(const scopedDebugLogging &) = delete;
    scopedDebugLogging &
    operator=(const scopedDebugLogging &) = delete;

private:
    absl::LogSeverityAtLeast prevMinLevel_;
    int prevVerbosity_;
};

/**
 * @brief Unique path under the test temporary directory. The file is
 *        removed when the guard goes out of scope.
 */
class scopedTempFile {
public:
    explicit scopedTempFile(const std::string &name);
    ~scopedTempFile();

    scopedTempFile(const scopedTempFile &) = delete;
    scopedTempFile &
    operator=(const scopedTempFile &) = delete;

    const std::string &
    path() const {
        return path_;
    }

    void
    write(const std::string &content) const;

    [[nodiscard]] std::string
    read() const;

private:
    std::string path_;
};

} // namespace gtest

#endif /* TEST_GTEST_COMMON_H */
