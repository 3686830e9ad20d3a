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

#include "metadata/OwnerResolver.h"

#include <map>
#include <thread>
#include <utility>

#include "common/StringTools.h"
#include "logger/Logger.h"

using namespace std;

namespace k8sagent {

namespace {

struct OwnerKindKeys {
    ResourceAttributeKey nameKey;
    ResourceAttributeKey uidKey;
};

// Controller kinds recognized on owner references, lower case.
const map<string, OwnerKindKeys>& OwnerKinds() {
    static const map<string, OwnerKindKeys> sKinds = {
        {"replicaset", {ResourceAttributeKey::K8sReplicaSetName, ResourceAttributeKey::K8sReplicaSetUid}},
        {"deployment", {ResourceAttributeKey::K8sDeploymentName, ResourceAttributeKey::K8sDeploymentUid}},
        {"statefulset", {ResourceAttributeKey::K8sStatefulSetName, ResourceAttributeKey::K8sStatefulSetUid}},
        {"daemonset", {ResourceAttributeKey::K8sDaemonSetName, ResourceAttributeKey::K8sDaemonSetUid}},
        {"job", {ResourceAttributeKey::K8sJobName, ResourceAttributeKey::K8sJobUid}},
        {"cronjob", {ResourceAttributeKey::K8sCronJobName, ResourceAttributeKey::K8sCronJobUid}},
    };
    return sKinds;
}

void SleepFor(chrono::milliseconds delay) {
    this_thread::sleep_for(delay);
}

} // namespace

OwnerResolver::OwnerResolver(K8sObjectLookup* lookup, const BackoffPolicy& policy, uint32_t maxDepth)
    : OwnerResolver(lookup, policy, maxDepth, SleepFor) {
}

OwnerResolver::OwnerResolver(K8sObjectLookup* lookup, const BackoffPolicy& policy, uint32_t maxDepth, Sleeper sleeper)
    : mLookup(lookup), mPolicy(policy), mMaxDepth(maxDepth), mSleeper(std::move(sleeper)) {
}

TopologyAttributes
OwnerResolver::Resolve(const string& k8sNamespace, const ObjectMeta& meta, bool includeUid) const {
    TopologyAttributes attributes;
    AddParentResourceLabels(k8sNamespace, meta, includeUid, 0, attributes);
    return attributes;
}

void OwnerResolver::AddParentResourceLabels(const string& k8sNamespace,
                                            const ObjectMeta& meta,
                                            bool includeUid,
                                            uint32_t depth,
                                            TopologyAttributes& attributes) const {
    if (depth >= mMaxDepth) {
        LOG_WARNING(sLogger,
                    ("stop walking owner references", "max depth reached")("namespace", k8sNamespace)(
                        "object", meta.name)("depth", depth));
        return;
    }
    for (const auto& owner : meta.ownerReferences) {
        const string kind = ToLowerCaseString(owner.kind);
        auto kindIt = OwnerKinds().find(kind);
        if (kindIt == OwnerKinds().end()) {
            continue;
        }
        attributes[kindIt->second.nameKey] = owner.name;
        if (includeUid) {
            attributes[kindIt->second.uidKey] = owner.uid;
        }
        if (kind != "replicaset") {
            continue;
        }

        // The interesting parent of a ReplicaSet, e.g. a Deployment, is only on the ReplicaSet itself.
        if (mLookup == nullptr) {
            LOG_DEBUG(sLogger, ("no object lookup, skip replicaset owners", owner.name)("namespace", k8sNamespace));
            continue;
        }
        ReplicaSet replicaSet;
        uint32_t attempts = 0;
        string errorMsg;
        LookupStatus status = GetReplicaSetWithRetry(k8sNamespace, owner.name, replicaSet, attempts, errorMsg);
        if (status != LookupStatus::kOk) {
            LOG_WARNING(sLogger,
                        ("failed to get replicaset", owner.name)("namespace", k8sNamespace)("status", LookupStatusToString(status))(
                            "attempts", attempts)("error", errorMsg));
            continue;
        }
        AddParentResourceLabels(k8sNamespace, replicaSet.metadata, includeUid, depth + 1, attributes);
    }
}

LookupStatus OwnerResolver::GetReplicaSetWithRetry(const string& k8sNamespace,
                                                   const string& name,
                                                   ReplicaSet& replicaSet,
                                                   uint32_t& attempts,
                                                   string& errorMsg) const {
    ExponentialBackoff backoff(mPolicy);
    LookupStatus status = LookupStatus::kError;
    attempts = 0;
    while (attempts < mPolicy.maxAttempts) {
        ++attempts;
        errorMsg.clear();
        status = mLookup->GetReplicaSet(k8sNamespace, name, replicaSet, errorMsg);
        if (status != LookupStatus::kNotFound || attempts >= mPolicy.maxAttempts) {
            break;
        }
        auto delay = backoff.NextDelay();
        LOG_DEBUG(sLogger, ("replicaset not found yet", name)("namespace", k8sNamespace)("attempt", attempts)(
                               "retry after ms", delay.count()));
        mSleeper(delay);
    }
    return status;
}

} // namespace k8sagent
