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
#include <chrono>
#include <cstdint>
#include <random>

namespace k8sagent {

struct BackoffPolicy {
    std::chrono::milliseconds initialDelay{10};
    double factor = 1.5;
    // Each delay is spread uniformly over [d * (1 - jitter), d * (1 + jitter)].
    double jitter = 0.1;
    uint32_t maxAttempts = 20;
    std::chrono::milliseconds maxDelay{2000};
};

// Produces the delays between consecutive attempts of one retry loop.
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const BackoffPolicy& policy);

    // Delay to wait before the next attempt, never above policy.maxDelay.
    std::chrono::milliseconds NextDelay();

private:
    BackoffPolicy mPolicy;
    double mCurrentMs;
    std::mt19937 mRandom;
};

} // namespace k8sagent
