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

#include "common/configuration.h"
#include "common.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <limits>
#include <string>

namespace ostress::config {
namespace {

const std::string variable = "OSTRESS_CONFIG_TEST";
const std::string undefined = "ASDLFHASLK1298159816";

template<typename T>
void
expectOverride(const std::string &input, const T initial, const T expected) {
    gtest::ScopedEnv env;
    env.addVar(variable, input);
    T value = initial;
    overrideFromEnv(value, variable);
    EXPECT_EQ(value, expected) << "input '" << input << "'";
}

template<typename T>
void
expectRejected(const std::string &input) {
    EXPECT_ANY_THROW((void)convertTraits<T>::convert(input)) << "input '" << input << "'";
    expectOverride<T>(input, T(7), T(7));
}

} // namespace

TEST(Config, EnvWrapper) {
    gtest::ScopedEnv env;
    env.addVar(variable, "foo");
    EXPECT_EQ(getenvOptional(variable), "foo");
    EXPECT_FALSE(getenvOptional(undefined).has_value());
}

TEST(Config, ConvertSwitch) {
    for (const std::string on : {"1", "yes", "Yes", "oN", "TRUE", "enable", "y"}) {
        EXPECT_TRUE(convertTraits<bool>::convert(on)) << on;
        expectOverride(on, false, true);
    }
    for (const std::string off : {"0", "no", "nO", "oFF", "false", "DISABLE", "n"}) {
        EXPECT_FALSE(convertTraits<bool>::convert(off)) << off;
        expectOverride(off, true, false);
    }
    for (const std::string bad : {"", "2", "enabled", "maybe"}) {
        EXPECT_ANY_THROW((void)convertTraits<bool>::convert(bad)) << bad;
        expectOverride(bad, true, true);
    }
}

TEST(Config, ConvertInt) {
    expectOverride("0", 5, 0);
    expectOverride("4096", 5, 4096);
    expectOverride("-42", 5, -42);
    const int max_value = std::numeric_limits<int>::max();
    expectOverride(std::to_string(max_value), 5, max_value);

    expectRejected<int>("");
    expectRejected<int>("-");
    expectRejected<int>("+1");
    expectRejected<int>(" 1");
    expectRejected<int>("1 ");
    expectRejected<int>("1k");
    expectRejected<int>("0x10");
    expectRejected<int>(std::to_string(max_value) + "0");
}

TEST(Config, ConvertUnsignedHasNoSign) {
    EXPECT_EQ(convertTraits<std::uint64_t>::convert("18446744073709551615"),
              std::numeric_limits<std::uint64_t>::max());
    EXPECT_ANY_THROW((void)convertTraits<std::uint64_t>::convert("-1"));
}

TEST(Config, OverrideFromEnv) {
    gtest::ScopedEnv env;
    env.addVar(variable, "64");

    int value = 1;
    overrideFromEnv(value, variable);
    EXPECT_EQ(value, 64);

    std::string text = "keep";
    overrideFromEnv(text, undefined);
    EXPECT_EQ(text, "keep");
}

TEST(Config, OverrideFromEnvRejects) {
    gtest::ScopedEnv env;
    gtest::scopedTestLogSink sink;

    env.addVar(variable, "-3");
    int value = 7;
    overrideFromEnv(value, variable, [](int v) { return v > 0; });
    EXPECT_EQ(value, 7);
    EXPECT_EQ(sink.countWarningsMatching(variable), 1);

    env.addVar(variable, "maybe");
    bool flag = true;
    overrideFromEnv(flag, variable);
    EXPECT_TRUE(flag);
    EXPECT_EQ(sink.countWarningsMatching("maybe"), 1);
}

} // namespace ostress::config
