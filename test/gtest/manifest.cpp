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
#include "common.h"
#include "gtest/gtest.h"

#include <sstream>
#include <set>
#include <thread>
#include <vector>

namespace gtest {

TEST(Manifest, ParseSkipsBlankLines) {
    std::istringstream input("\n  key1.txt\nkey2/file.dat\n  \nkey3.zip \n");
    std::vector<std::string> keys;
    ASSERT_EQ(ostressParseManifest(input, keys), OSTRESS_SUCCESS);
    EXPECT_EQ(keys, (std::vector<std::string>{"key1.txt", "key2/file.dat", "key3.zip"}));
}

TEST(Manifest, ParseKeepsDuplicatesAndInnerSpaces) {
    std::istringstream input("a\r\nb c\na\n\t\n");
    std::vector<std::string> keys;
    ASSERT_EQ(ostressParseManifest(input, keys), OSTRESS_SUCCESS);
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b c", "a"}));
}

TEST(Manifest, ParseRejectsEmpty) {
    std::istringstream input("\n   \n\t\n");
    std::vector<std::string> keys = {"stale"};
    EXPECT_EQ(ostressParseManifest(input, keys), OSTRESS_ERR_INVALID_PARAM);
    EXPECT_EQ(keys, std::vector<std::string>{"stale"});
}

TEST(Manifest, LoadMissingFile) {
    scopedTempFile file("missing.txt");
    std::vector<std::string> keys;
    EXPECT_EQ(ostressLoadManifest(file.path(), keys), OSTRESS_ERR_NOT_FOUND);
}

TEST(Manifest, LoadEmptyFile) {
    scopedTempFile file("empty.txt");
    file.write("");
    std::vector<std::string> keys;
    EXPECT_EQ(ostressLoadManifest(file.path(), keys), OSTRESS_ERR_INVALID_PARAM);
}

TEST(Manifest, WriteThenLoad) {
    scopedTempFile file("roundtrip.txt");
    {
        ostressManifestWriter writer(file.path());
        for (const auto &key : {"a/1", "b 2", "c/3"}) {
            ASSERT_EQ(writer.addKey(key), OSTRESS_SUCCESS);
        }
        ASSERT_EQ(writer.close(), OSTRESS_SUCCESS);
    }

    std::vector<std::string> keys;
    ASSERT_EQ(ostressLoadManifest(file.path(), keys), OSTRESS_SUCCESS);
    EXPECT_EQ(keys, (std::vector<std::string>{"a/1", "b 2", "c/3"}));
}

TEST(Manifest, WriterTruncates) {
    scopedTempFile file("truncate.txt");
    file.write("old-key\nother-key\n");

    ostressManifestWriter writer(file.path());
    ASSERT_EQ(writer.addKey("new-key"), OSTRESS_SUCCESS);
    ASSERT_EQ(writer.close(), OSTRESS_SUCCESS);
    EXPECT_EQ(file.read(), "new-key\n");
}

TEST(Manifest, WriterClosed) {
    scopedTempFile file("closed.txt");
    ostressManifestWriter writer(file.path());
    ASSERT_EQ(writer.close(), OSTRESS_SUCCESS);
    EXPECT_EQ(writer.close(), OSTRESS_SUCCESS);
    EXPECT_EQ(writer.addKey("late"), OSTRESS_ERR_NOT_ALLOWED);
    EXPECT_EQ(file.read(), "");
}

TEST(Manifest, WriterBadPath) {
    EXPECT_THROW(ostressManifestWriter("/nonexistent-dir/ostress/manifest.txt"),
                 std::runtime_error);
}

TEST(Manifest, ConcurrentAppends) {
    constexpr int num_threads = 8;
    constexpr int keys_per_thread = 200;
    scopedTempFile file("concurrent.txt");

    {
        ostressManifestWriter writer(file.path());
        std::vector<std::thread> threads;
        for (int t = 0; t < num_threads; t++) {
            threads.emplace_back([&writer, t]() {
                for (int i = 0; i < keys_per_thread; i++) {
                    EXPECT_EQ(writer.addKey("worker" + std::to_string(t) + "/" +
                                            std::to_string(i)),
                              OSTRESS_SUCCESS);
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
    }

    std::vector<std::string> keys;
    ASSERT_EQ(ostressLoadManifest(file.path(), keys), OSTRESS_SUCCESS);
    ASSERT_EQ(keys.size(), size_t(num_threads * keys_per_thread));
    const std::set<std::string> unique(keys.begin(), keys.end());
    EXPECT_EQ(unique.size(), keys.size());
    EXPECT_EQ(unique.count("worker3/199"), 1u);
}

} // namespace gtest
