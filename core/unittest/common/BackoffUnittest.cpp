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

#include "common/Backoff.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class BackoffUnittest : public ::testing::Test {
public:
    void TestDefaultPolicy();
    void TestGrowthWithoutJitter();
    void TestJitterBounds();
    void TestCap();
};

void BackoffUnittest::TestDefaultPolicy() {
    BackoffPolicy policy;
    K8SAGENT_TEST_EQUAL(10, policy.initialDelay.count());
    K8SAGENT_TEST_EQUAL(1.5, policy.factor);
    K8SAGENT_TEST_EQUAL(0.1, policy.jitter);
    K8SAGENT_TEST_EQUAL(20U, policy.maxAttempts);
    K8SAGENT_TEST_EQUAL(2000, policy.maxDelay.count());
}

void BackoffUnittest::TestGrowthWithoutJitter() {
    BackoffPolicy policy;
    policy.initialDelay = chrono::milliseconds(100);
    policy.factor = 2.0;
    policy.jitter = 0.0;
    policy.maxDelay = chrono::milliseconds(10000);
    ExponentialBackoff backoff(policy);
    K8SAGENT_TEST_EQUAL(100, backoff.NextDelay().count());
    K8SAGENT_TEST_EQUAL(200, backoff.NextDelay().count());
    K8SAGENT_TEST_EQUAL(400, backoff.NextDelay().count());
    K8SAGENT_TEST_EQUAL(800, backoff.NextDelay().count());
}

void BackoffUnittest::TestJitterBounds() {
    BackoffPolicy policy;
    policy.initialDelay = chrono::milliseconds(1000);
    policy.factor = 1.0;
    policy.jitter = 0.1;
    policy.maxDelay = chrono::milliseconds(5000);
    ExponentialBackoff backoff(policy);
    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.NextDelay().count();
        K8SAGENT_TEST_GE(delay, 900);
        K8SAGENT_TEST_LE(delay, 1100);
    }
}

void BackoffUnittest::TestCap() {
    BackoffPolicy policy;
    ExponentialBackoff backoff(policy);
    chrono::milliseconds total(0);
    for (uint32_t i = 0; i < policy.maxAttempts; ++i) {
        auto delay = backoff.NextDelay();
        K8SAGENT_TEST_LE(delay.count(), policy.maxDelay.count());
        total += delay;
    }
    // 20 attempts of the default policy stay within a few seconds.
    K8SAGENT_TEST_LT(total.count(), 20 * policy.maxDelay.count());
    // Once capped, jitter can only pull the delay below the cap.
    auto capped = backoff.NextDelay().count();
    K8SAGENT_TEST_GE(capped, 1800);
    K8SAGENT_TEST_LE(capped, 2000);
}

UNIT_TEST_CASE(BackoffUnittest, TestDefaultPolicy)
UNIT_TEST_CASE(BackoffUnittest, TestGrowthWithoutJitter)
UNIT_TEST_CASE(BackoffUnittest, TestJitterBounds)
UNIT_TEST_CASE(BackoffUnittest, TestCap)

} // namespace k8sagent

UNIT_TEST_MAIN
