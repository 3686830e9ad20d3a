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

#include "instrumentation/ResourceMapBuilder.h"
#include "metadata/K8sObjectLookup.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class ResourceMapBuilderUnittest : public ::testing::Test {
public:
    void TestDeclaredKeys();
    void TestTopology();
    void TestUserAttributesWin();
    void TestDeclaredKeysExcluded();
    void TestEmptyValuesSkipped();
    void TestIndexOutOfRange();

protected:
    static Pod MakePod() {
        Pod pod;
        pod.metadata.name = "web-7d4b9c-x2x5z";
        pod.metadata.k8sNamespace = "shop";
        pod.metadata.uid = "pod-uid";
        OwnerReference owner;
        owner.kind = "ReplicaSet";
        owner.name = "web-7d4b9c";
        owner.uid = "rs-uid";
        pod.metadata.ownerReferences.push_back(owner);
        pod.spec.nodeName = "node-1";
        Container app;
        app.name = "app";
        app.image = "registry.local/web:1.4.2";
        pod.spec.containers.push_back(app);
        return pod;
    }

    static Namespace MakeNamespace() {
        Namespace ns;
        ns.metadata.name = "shop";
        return ns;
    }

    void SetUp() override {
        ReplicaSet replicaSet;
        replicaSet.metadata.name = "web-7d4b9c";
        replicaSet.metadata.k8sNamespace = "shop";
        OwnerReference owner;
        owner.kind = "Deployment";
        owner.name = "web";
        owner.uid = "dep-uid";
        replicaSet.metadata.ownerReferences.push_back(owner);
        mLookup.AddReplicaSet(replicaSet);
    }

    OwnerResolver MakeResolver() {
        return OwnerResolver(&mLookup, BackoffPolicy(), 5, [](chrono::milliseconds) {});
    }

    StaticObjectLookup mLookup;
};

void ResourceMapBuilderUnittest::TestDeclaredKeys() {
    Pod pod = MakePod();
    K8SAGENT_TEST_TRUE(GetDeclaredResourceKeys(pod, 0).empty());
    K8SAGENT_TEST_TRUE(GetDeclaredResourceKeys(pod, 3).empty());

    pod.spec.containers[0].env.push_back(MakeEnvVar("OTEL_RESOURCE_ATTRIBUTES", "team=payments,k8s.pod.name=x,broken"));
    set<string> declared = GetDeclaredResourceKeys(pod, 0);
    K8SAGENT_TEST_EQUAL(2U, declared.size());
    K8SAGENT_TEST_TRUE(declared.count("team") == 1);
    K8SAGENT_TEST_TRUE(declared.count("k8s.pod.name") == 1);
}

void ResourceMapBuilderUnittest::TestTopology() {
    Instrumentation inst;
    ResourceMap res = BuildResourceMap(inst, MakeNamespace(), MakePod(), 0, MakeResolver());

    K8SAGENT_TEST_EQUAL("shop", res.Get(ResourceAttributeKey::K8sNamespaceName));
    K8SAGENT_TEST_EQUAL("app", res.Get(ResourceAttributeKey::K8sContainerName));
    K8SAGENT_TEST_EQUAL("web-7d4b9c-x2x5z", res.Get(ResourceAttributeKey::K8sPodName));
    K8SAGENT_TEST_EQUAL("pod-uid", res.Get(ResourceAttributeKey::K8sPodUid));
    K8SAGENT_TEST_EQUAL("node-1", res.Get(ResourceAttributeKey::K8sNodeName));
    K8SAGENT_TEST_EQUAL("shop.web-7d4b9c-x2x5z.app", res.Get(ResourceAttributeKey::ServiceInstanceId));
    K8SAGENT_TEST_EQUAL("web-7d4b9c", res.Get(ResourceAttributeKey::K8sReplicaSetName));
    K8SAGENT_TEST_EQUAL("web", res.Get(ResourceAttributeKey::K8sDeploymentName));
    // Owner uids only when asked for.
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sReplicaSetUid));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sDeploymentUid));
    K8SAGENT_TEST_EQUAL(8U, res.Size());

    inst.spec.resource.addK8sUIDAttributes = true;
    res = BuildResourceMap(inst, MakeNamespace(), MakePod(), 0, MakeResolver());
    K8SAGENT_TEST_EQUAL("rs-uid", res.Get(ResourceAttributeKey::K8sReplicaSetUid));
    K8SAGENT_TEST_EQUAL("dep-uid", res.Get(ResourceAttributeKey::K8sDeploymentUid));
    K8SAGENT_TEST_EQUAL(10U, res.Size());
}

void ResourceMapBuilderUnittest::TestUserAttributesWin() {
    Instrumentation inst;
    inst.spec.resource.attributes["k8s.deployment.name"] = "storefront";
    inst.spec.resource.attributes["team"] = "payments";

    ResourceMap res = BuildResourceMap(inst, MakeNamespace(), MakePod(), 0, MakeResolver());
    K8SAGENT_TEST_EQUAL("storefront", res.Get(ResourceAttributeKey::K8sDeploymentName));
    K8SAGENT_TEST_EQUAL("payments", res.Get("team"));
}

void ResourceMapBuilderUnittest::TestDeclaredKeysExcluded() {
    Instrumentation inst;
    inst.spec.resource.attributes["team"] = "payments";
    Pod pod = MakePod();
    pod.spec.containers[0].env.push_back(
        MakeEnvVar("OTEL_RESOURCE_ATTRIBUTES", "team=search,k8s.node.name=$(NODE),service.instance.id=fixed"));

    ResourceMap res = BuildResourceMap(inst, MakeNamespace(), pod, 0, MakeResolver());
    K8SAGENT_TEST_FALSE(res.Contains("team"));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sNodeName));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::ServiceInstanceId));
    K8SAGENT_TEST_TRUE(res.Contains(ResourceAttributeKey::K8sPodName));
}

void ResourceMapBuilderUnittest::TestEmptyValuesSkipped() {
    Instrumentation inst;
    Pod pod = MakePod();
    // A pod template at admission time has no name, uid or node yet.
    pod.metadata.name.clear();
    pod.metadata.uid.clear();
    pod.spec.nodeName.clear();

    ResourceMap res = BuildResourceMap(inst, MakeNamespace(), pod, 0, MakeResolver());
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sPodName));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sPodUid));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sNodeName));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::ServiceInstanceId));
    K8SAGENT_TEST_EQUAL("shop", res.Get(ResourceAttributeKey::K8sNamespaceName));
    K8SAGENT_TEST_EQUAL("web", res.Get(ResourceAttributeKey::K8sDeploymentName));
}

void ResourceMapBuilderUnittest::TestIndexOutOfRange() {
    Instrumentation inst;
    inst.spec.resource.attributes["team"] = "payments";
    K8SAGENT_TEST_TRUE(BuildResourceMap(inst, MakeNamespace(), MakePod(), 1, MakeResolver()).Empty());
}

UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestDeclaredKeys)
UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestTopology)
UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestUserAttributesWin)
UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestDeclaredKeysExcluded)
UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestEmptyValuesSkipped)
UNIT_TEST_CASE(ResourceMapBuilderUnittest, TestIndexOutOfRange)

} // namespace k8sagent

UNIT_TEST_MAIN
