// Copyright 2024 k8s-agents-injector Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "common/Backoff.h"

#include <algorithm>

namespace k8sagent {

ExponentialBackoff::ExponentialBackoff(const BackoffPolicy& policy)
    : mPolicy(policy), mCurrentMs(static_cast<double>(policy.initialDelay.count())), mRandom(std::random_device{}()) {
}

std::chrono::milliseconds ExponentialBackoff::NextDelay() {
    const double capMs = static_cast<double>(mPolicy.maxDelay.count());
    double delayMs = std::min(mCurrentMs, capMs);
    if (mPolicy.jitter > 0) {
        std::uniform_real_distribution<double> dist(-mPolicy.jitter, mPolicy.jitter);
        delayMs += delayMs * dist(mRandom);
    }
    delayMs = std::max(0.0, std::min(delayMs, capMs));
    mCurrentMs = std::min(mCurrentMs * mPolicy.factor, capMs);
    return std::chrono::milliseconds(static_cast<int64_t>(delayMs));
}

} // namespace k8sagent
