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
#include <functional>
#include <string>

#include "common/Backoff.h"
#include "constants/ResourceAttributeKeys.h"
#include "metadata/K8sObjectLookup.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// Walks the owner references of an object and reports the workload controllers
// it belongs to as k8s.<kind>.name / k8s.<kind>.uid attributes.
//
// A pod created by a Deployment only references its ReplicaSet, so the
// ReplicaSet is fetched through the lookup and its own owners are walked too.
// The fetch is retried while the lookup answers "not found" (the ReplicaSet
// may not be visible yet when the pod is admitted). Any other failure, or
// running out of attempts, ends the walk at that ReplicaSet: resolution is best
// effort and never fails the caller.
class OwnerResolver {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // @lookup may be null, ReplicaSets are then not followed.
    OwnerResolver(K8sObjectLookup* lookup, const BackoffPolicy& policy, uint32_t maxDepth);
    OwnerResolver(K8sObjectLookup* lookup, const BackoffPolicy& policy, uint32_t maxDepth, Sleeper sleeper);

    TopologyAttributes Resolve(const std::string& k8sNamespace, const ObjectMeta& meta, bool includeUid) const;

private:
    void AddParentResourceLabels(const std::string& k8sNamespace,
                                 const ObjectMeta& meta,
                                 bool includeUid,
                                 uint32_t depth,
                                 TopologyAttributes& attributes) const;
    LookupStatus GetReplicaSetWithRetry(const std::string& k8sNamespace,
                                        const std::string& name,
                                        ReplicaSet& replicaSet,
                                        uint32_t& attempts,
                                        std::string& errorMsg) const;

    K8sObjectLookup* mLookup;
    BackoffPolicy mPolicy;
    uint32_t mMaxDepth;
    Sleeper mSleeper;

#ifdef K8SAGENT_UNIT_TEST_MAIN
    friend class OwnerResolverUnittest;
#endif
};

} // namespace k8sagent
