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

#include <chrono>
#include <vector>

#include "metadata/K8sObjectLookup.h"
#include "metadata/OwnerResolver.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

// Answers every ReplicaSet lookup with the same status and counts the calls.
class CountingObjectLookup : public K8sObjectLookup {
public:
    explicit CountingObjectLookup(LookupStatus status) : mStatus(status) {}

    LookupStatus GetReplicaSet(const string& k8sNamespace,
                               const string& name,
                               ReplicaSet& replicaSet,
                               string& errorMsg) override {
        ++mCalls;
        if (mStatus != LookupStatus::kOk) {
            errorMsg = "replicaset " + k8sNamespace + "/" + name + " " + LookupStatusToString(mStatus);
        }
        return mStatus;
    }

    LookupStatus mStatus;
    uint32_t mCalls = 0;
};

class OwnerResolverUnittest : public ::testing::Test {
public:
    void TestDirectOwners();
    void TestDeploymentThroughReplicaSet();
    void TestReplicaSetNotFoundRetries();
    void TestReplicaSetErrorStops();
    void TestReplicaSetAppearsLate();
    void TestNoLookup();
    void TestDepthLimit();
    void TestStaticObjectLookup();

protected:
    static OwnerReference MakeOwner(const string& kind, const string& name, const string& uid) {
        OwnerReference owner;
        owner.apiVersion = "apps/v1";
        owner.kind = kind;
        owner.name = name;
        owner.uid = uid;
        return owner;
    }

    static ObjectMeta MakePodMeta(const vector<OwnerReference>& owners) {
        ObjectMeta meta;
        meta.name = "web-7d4b9c-x2x5z";
        meta.k8sNamespace = "shop";
        meta.ownerReferences = owners;
        return meta;
    }

    static ReplicaSet MakeReplicaSet(const string& name, const vector<OwnerReference>& owners) {
        ReplicaSet replicaSet;
        replicaSet.metadata.name = name;
        replicaSet.metadata.k8sNamespace = "shop";
        replicaSet.metadata.ownerReferences = owners;
        return replicaSet;
    }

    OwnerResolver::Sleeper RecordingSleeper() {
        return [this](chrono::milliseconds delay) { mDelays.push_back(delay); };
    }

    vector<chrono::milliseconds> mDelays;
};

void OwnerResolverUnittest::TestDirectOwners() {
    OwnerResolver resolver(nullptr, BackoffPolicy(), 5, RecordingSleeper());
    ObjectMeta meta = MakePodMeta({MakeOwner("StatefulSet", "db", "sts-uid"),
                                   MakeOwner("DaemonSet", "agent", "ds-uid"),
                                   MakeOwner("Job", "migrate", "job-uid"),
                                   MakeOwner("CronJob", "nightly", "cron-uid"),
                                   MakeOwner("Node", "node-1", "node-uid")});

    TopologyAttributes attrs = resolver.Resolve("shop", meta, false);
    K8SAGENT_TEST_EQUAL(4U, attrs.size());
    K8SAGENT_TEST_EQUAL("db", attrs[ResourceAttributeKey::K8sStatefulSetName]);
    K8SAGENT_TEST_EQUAL("agent", attrs[ResourceAttributeKey::K8sDaemonSetName]);
    K8SAGENT_TEST_EQUAL("migrate", attrs[ResourceAttributeKey::K8sJobName]);
    K8SAGENT_TEST_EQUAL("nightly", attrs[ResourceAttributeKey::K8sCronJobName]);

    attrs = resolver.Resolve("shop", meta, true);
    K8SAGENT_TEST_EQUAL(8U, attrs.size());
    K8SAGENT_TEST_EQUAL("sts-uid", attrs[ResourceAttributeKey::K8sStatefulSetUid]);
    K8SAGENT_TEST_EQUAL("cron-uid", attrs[ResourceAttributeKey::K8sCronJobUid]);
    K8SAGENT_TEST_TRUE(mDelays.empty());
}

void OwnerResolverUnittest::TestDeploymentThroughReplicaSet() {
    StaticObjectLookup lookup;
    lookup.AddReplicaSet(MakeReplicaSet("web-7d4b9c", {MakeOwner("deployment", "web", "dep-uid")}));
    OwnerResolver resolver(&lookup, BackoffPolicy(), 5, RecordingSleeper());

    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), true);
    K8SAGENT_TEST_EQUAL(4U, attrs.size());
    K8SAGENT_TEST_EQUAL("web-7d4b9c", attrs[ResourceAttributeKey::K8sReplicaSetName]);
    K8SAGENT_TEST_EQUAL("rs-uid", attrs[ResourceAttributeKey::K8sReplicaSetUid]);
    K8SAGENT_TEST_EQUAL("web", attrs[ResourceAttributeKey::K8sDeploymentName]);
    K8SAGENT_TEST_EQUAL("dep-uid", attrs[ResourceAttributeKey::K8sDeploymentUid]);
    K8SAGENT_TEST_TRUE(mDelays.empty());
}

void OwnerResolverUnittest::TestReplicaSetNotFoundRetries() {
    CountingObjectLookup lookup(LookupStatus::kNotFound);
    BackoffPolicy policy;
    OwnerResolver resolver(&lookup, policy, 5, RecordingSleeper());

    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), false);
    K8SAGENT_TEST_EQUAL(20U, lookup.mCalls);
    K8SAGENT_TEST_EQUAL(19U, mDelays.size());
    for (const auto& delay : mDelays) {
        K8SAGENT_TEST_LE(delay.count(), policy.maxDelay.count());
    }
    K8SAGENT_TEST_LE(mDelays.front().count(), 11);
    K8SAGENT_TEST_GT(mDelays.back().count(), mDelays.front().count());

    // The ReplicaSet itself is still reported.
    K8SAGENT_TEST_EQUAL(1U, attrs.size());
    K8SAGENT_TEST_EQUAL("web-7d4b9c", attrs[ResourceAttributeKey::K8sReplicaSetName]);
}

void OwnerResolverUnittest::TestReplicaSetErrorStops() {
    CountingObjectLookup lookup(LookupStatus::kError);
    OwnerResolver resolver(&lookup, BackoffPolicy(), 5, RecordingSleeper());

    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), true);
    K8SAGENT_TEST_EQUAL(1U, lookup.mCalls);
    K8SAGENT_TEST_TRUE(mDelays.empty());
    K8SAGENT_TEST_EQUAL(2U, attrs.size());
    K8SAGENT_TEST_EQUAL("rs-uid", attrs[ResourceAttributeKey::K8sReplicaSetUid]);
}

void OwnerResolverUnittest::TestReplicaSetAppearsLate() {
    // Not found for the first three lookups, then served from memory.
    class LateObjectLookup : public StaticObjectLookup {
    public:
        LookupStatus GetReplicaSet(const string& k8sNamespace,
                                   const string& name,
                                   ReplicaSet& replicaSet,
                                   string& errorMsg) override {
            if (++mCalls <= 3) {
                errorMsg = "not yet";
                return LookupStatus::kNotFound;
            }
            return StaticObjectLookup::GetReplicaSet(k8sNamespace, name, replicaSet, errorMsg);
        }
        uint32_t mCalls = 0;
    };
    LateObjectLookup lookup;
    lookup.AddReplicaSet(MakeReplicaSet("web-7d4b9c", {MakeOwner("Deployment", "web", "dep-uid")}));
    OwnerResolver resolver(&lookup, BackoffPolicy(), 5, RecordingSleeper());

    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), false);
    K8SAGENT_TEST_EQUAL(4U, lookup.mCalls);
    K8SAGENT_TEST_EQUAL(3U, mDelays.size());
    K8SAGENT_TEST_EQUAL("web", attrs[ResourceAttributeKey::K8sDeploymentName]);
}

void OwnerResolverUnittest::TestNoLookup() {
    OwnerResolver resolver(nullptr, BackoffPolicy(), 5, RecordingSleeper());
    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), false);
    K8SAGENT_TEST_EQUAL(1U, attrs.size());
    K8SAGENT_TEST_EQUAL("web-7d4b9c", attrs[ResourceAttributeKey::K8sReplicaSetName]);
}

void OwnerResolverUnittest::TestDepthLimit() {
    // A ReplicaSet owned by itself must not be walked forever.
    StaticObjectLookup lookup;
    lookup.AddReplicaSet(MakeReplicaSet("loop", {MakeOwner("ReplicaSet", "loop", "rs-uid")}));
    CountingObjectLookup counter(LookupStatus::kOk);
    OwnerResolver resolver(&lookup, BackoffPolicy(), 3, RecordingSleeper());

    TopologyAttributes attrs = resolver.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "loop", "rs-uid")}), false);
    K8SAGENT_TEST_EQUAL(1U, attrs.size());
    K8SAGENT_TEST_EQUAL("loop", attrs[ResourceAttributeKey::K8sReplicaSetName]);

    // With depth 1 the ReplicaSet is fetched once but its owners are not walked.
    OwnerResolver shallow(&counter, BackoffPolicy(), 1, RecordingSleeper());
    attrs = shallow.Resolve("shop", MakePodMeta({MakeOwner("ReplicaSet", "web-7d4b9c", "rs-uid")}), false);
    K8SAGENT_TEST_EQUAL("web-7d4b9c", attrs[ResourceAttributeKey::K8sReplicaSetName]);
    K8SAGENT_TEST_EQUAL(1U, counter.mCalls);
}

void OwnerResolverUnittest::TestStaticObjectLookup() {
    StaticObjectLookup lookup;
    lookup.AddReplicaSet(MakeReplicaSet("web-7d4b9c", {}));
    ReplicaSet replicaSet;
    string errorMsg;
    K8SAGENT_TEST_TRUE(LookupStatus::kOk == lookup.GetReplicaSet("shop", "web-7d4b9c", replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL("web-7d4b9c", replicaSet.metadata.name);
    K8SAGENT_TEST_TRUE(LookupStatus::kNotFound == lookup.GetReplicaSet("other", "web-7d4b9c", replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL("replicasets \"web-7d4b9c\" not found", errorMsg);
    K8SAGENT_TEST_EQUAL(string("not found"), LookupStatusToString(LookupStatus::kNotFound));
}

UNIT_TEST_CASE(OwnerResolverUnittest, TestDirectOwners)
UNIT_TEST_CASE(OwnerResolverUnittest, TestDeploymentThroughReplicaSet)
UNIT_TEST_CASE(OwnerResolverUnittest, TestReplicaSetNotFoundRetries)
UNIT_TEST_CASE(OwnerResolverUnittest, TestReplicaSetErrorStops)
UNIT_TEST_CASE(OwnerResolverUnittest, TestReplicaSetAppearsLate)
UNIT_TEST_CASE(OwnerResolverUnittest, TestNoLookup)
UNIT_TEST_CASE(OwnerResolverUnittest, TestDepthLimit)
UNIT_TEST_CASE(OwnerResolverUnittest, TestStaticObjectLookup)

} // namespace k8sagent

UNIT_TEST_MAIN
