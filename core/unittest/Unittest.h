/*
 * Copyright 2024 k8s-agents-injector Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once
#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "logger/Logger.h"

namespace bfs = boost::filesystem;

#define K8SAGENT_TEST_TRUE(condition) \
    do { \
        EXPECT_TRUE(condition); \
    } while (0)

#define K8SAGENT_TEST_TRUE_DESC(condition, desc) \
    do { \
        bool _rst_inner = (condition); \
        LOG_INFO(sLogger, ("K8SAGENT_TEST_TRUE", _rst_inner)("condition", #condition)("DESC", desc)); \
        EXPECT_TRUE(_rst_inner); \
    } while (0)

#define K8SAGENT_TEST_TRUE_FATAL(condition) \
    do { \
        ASSERT_TRUE(condition); \
    } while (0)

#define K8SAGENT_TEST_FALSE(condition) \
    do { \
        EXPECT_FALSE(condition); \
    } while (0)

#define K8SAGENT_TEST_FALSE_FATAL(condition) \
    do { \
        ASSERT_FALSE(condition); \
    } while (0)

#define K8SAGENT_TEST_EQUAL(expected, actual) \
    do { \
        EXPECT_EQ(expected, actual); \
    } while (0)

#define K8SAGENT_TEST_EQUAL_FATAL(expected, actual) \
    do { \
        ASSERT_EQ(expected, actual); \
    } while (0)

#define K8SAGENT_TEST_NOT_EQUAL(expected, actual) \
    do { \
        EXPECT_NE(expected, actual); \
    } while (0)

#define K8SAGENT_TEST_STREQ(expected, actual) \
    do { \
        EXPECT_STREQ(expected, actual); \
    } while (0)

#define K8SAGENT_TEST_GT(big, small) \
    do { \
        EXPECT_GT(big, small); \
    } while (0)

#define K8SAGENT_TEST_LT(small, big) \
    do { \
        EXPECT_LT(small, big); \
    } while (0)

#define K8SAGENT_TEST_GE(big, small) \
    do { \
        EXPECT_GE(big, small); \
    } while (0)

#define K8SAGENT_TEST_LE(small, big) \
    do { \
        EXPECT_LE(small, big); \
    } while (0)

#define K8SAGENT_UNIT_TEST_CASE(suite, case, id) \
    TEST_F(suite, case) { \
        case(); \
    }

#define UNIT_TEST_CASE(suite, case) K8SAGENT_UNIT_TEST_CASE(suite, case, 0)

#define UNIT_TEST_MAIN \
    int main(int argc, char** argv) { \
        k8sagent::Logger::Instance().InitGlobalLoggers(); \
        ::testing::InitGoogleTest(&argc, argv); \
        return RUN_ALL_TESTS(); \
    }

// Fresh directory under the system temp dir, removed with everything in it on
// destruction.
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string& prefix)
        : mPath(bfs::temp_directory_path() / bfs::unique_path(prefix + "_%%%%%%")) {
        bfs::create_directories(mPath);
    }
    ~TemporaryDirectory() {
        boost::system::error_code ec;
        bfs::remove_all(mPath, ec);
    }
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const bfs::path& Path() const { return mPath; }
    std::string File(const std::string& name) const { return (mPath / name).string(); }

private:
    bfs::path mPath;
};

inline void SetEnv(const char* key, const char* value) {
    setenv(key, value, 1);
}

inline void UnsetEnv(const char* key) {
    unsetenv(key);
}
