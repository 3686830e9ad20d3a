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

#include "common/StringTools.h"
#include "unittest/Unittest.h"

namespace k8sagent {

class StringToolsUnittest : public ::testing::Test {};

TEST_F(StringToolsUnittest, TestStartWith) {
    EXPECT_TRUE(StartWith("NEW_RELIC_APP_NAME", "NEW_RELIC_"));
    EXPECT_TRUE(StartWith("OTEL_", "OTEL_"));
    EXPECT_FALSE(StartWith("OTEL", "OTEL_"));
    EXPECT_FALSE(StartWith("", "OTEL_"));
    EXPECT_TRUE(StartWith("anything", ""));
}

TEST_F(StringToolsUnittest, TestEndWith) {
    EXPECT_TRUE(EndWith("k8s.pod.name=a,", ","));
    EXPECT_FALSE(EndWith("k8s.pod.name=a", ","));
    EXPECT_FALSE(EndWith("", ","));
}

TEST_F(StringToolsUnittest, TestToLowerCaseString) {
    EXPECT_EQ("replicaset", ToLowerCaseString("ReplicaSet"));
    EXPECT_EQ("cronjob", ToLowerCaseString("CronJob"));
}

TEST_F(StringToolsUnittest, TestTrimString) {
    EXPECT_EQ("a=b", TrimString("  a=b\t"));
    EXPECT_EQ("token", TrimString("token\n"));
    EXPECT_EQ("", TrimString(" \r\n"));
}

TEST_F(StringToolsUnittest, TestStringTo) {
    EXPECT_TRUE(StringTo<bool>("true"));
    EXPECT_FALSE(StringTo<bool>("false"));
    EXPECT_FALSE(StringTo<bool>("any"));
    EXPECT_EQ(20, StringTo<int>("20"));

    int value = 7;
    EXPECT_TRUE(StringTo("443", value));
    EXPECT_EQ(443, value);
    EXPECT_FALSE(StringTo("https", value));
    EXPECT_EQ(443, value);
}

TEST_F(StringToolsUnittest, TestSplitString) {
    std::vector<std::string> expected{"a", "", "b"};
    EXPECT_EQ(expected, SplitString("a,,b", ","));
    EXPECT_EQ(std::vector<std::string>{""}, SplitString("", ","));
    EXPECT_EQ((std::vector<std::string>{"k", "v"}), SplitString("k=v", "="));
}

TEST_F(StringToolsUnittest, TestJoinString) {
    EXPECT_EQ("", JoinString({}, ","));
    EXPECT_EQ("tracecontext", JoinString({"tracecontext"}, ","));
    EXPECT_EQ("tracecontext,baggage,b3", JoinString({"tracecontext", "baggage", "b3"}, ","));
}

} // namespace k8sagent

UNIT_TEST_MAIN
