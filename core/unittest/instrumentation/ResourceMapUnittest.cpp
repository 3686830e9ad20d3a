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

#include "instrumentation/ResourceMap.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class ResourceMapUnittest : public ::testing::Test {};

TEST_F(ResourceMapUnittest, TestSetAndGet) {
    ResourceMap res;
    K8SAGENT_TEST_TRUE(res.Empty());
    res.Set(ResourceAttributeKey::K8sPodName, "web-1");
    res.Set("team", "shop");
    K8SAGENT_TEST_TRUE(res.Contains("k8s.pod.name"));
    K8SAGENT_TEST_TRUE(res.Contains(ResourceAttributeKey::K8sPodName));
    K8SAGENT_TEST_FALSE(res.Contains(ResourceAttributeKey::K8sNodeName));
    K8SAGENT_TEST_EQUAL("web-1", res.Get(ResourceAttributeKey::K8sPodName));
    K8SAGENT_TEST_EQUAL("shop", res.Get("team"));
    K8SAGENT_TEST_EQUAL("", res.Get("missing"));
    K8SAGENT_TEST_EQUAL(2U, res.Size());
}

TEST_F(ResourceMapUnittest, TestAttributeNames) {
    K8SAGENT_TEST_EQUAL("k8s.namespace.name", ResourceAttributeName(ResourceAttributeKey::K8sNamespaceName));
    K8SAGENT_TEST_EQUAL("k8s.container.name", ResourceAttributeName(ResourceAttributeKey::K8sContainerName));
    K8SAGENT_TEST_EQUAL("k8s.pod.uid", ResourceAttributeName(ResourceAttributeKey::K8sPodUid));
    K8SAGENT_TEST_EQUAL("k8s.node.name", ResourceAttributeName(ResourceAttributeKey::K8sNodeName));
    K8SAGENT_TEST_EQUAL("k8s.replicaset.name", ResourceAttributeName(ResourceAttributeKey::K8sReplicaSetName));
    K8SAGENT_TEST_EQUAL("k8s.deployment.uid", ResourceAttributeName(ResourceAttributeKey::K8sDeploymentUid));
    K8SAGENT_TEST_EQUAL("k8s.statefulset.name", ResourceAttributeName(ResourceAttributeKey::K8sStatefulSetName));
    K8SAGENT_TEST_EQUAL("k8s.daemonset.name", ResourceAttributeName(ResourceAttributeKey::K8sDaemonSetName));
    K8SAGENT_TEST_EQUAL("k8s.job.name", ResourceAttributeName(ResourceAttributeKey::K8sJobName));
    K8SAGENT_TEST_EQUAL("k8s.cronjob.name", ResourceAttributeName(ResourceAttributeKey::K8sCronJobName));
    K8SAGENT_TEST_EQUAL("service.instance.id", ResourceAttributeName(ResourceAttributeKey::ServiceInstanceId));
    K8SAGENT_TEST_EQUAL("service.version", ResourceAttributeName(ResourceAttributeKey::ServiceVersion));
}

TEST_F(ResourceMapUnittest, TestResourceMapToStr) {
    ResourceMap res;
    K8SAGENT_TEST_EQUAL("", ResourceMapToStr(res));

    res.Set("k8s.pod.name", "web-1");
    res.Set("k8s.container.name", "web");
    res.Set("a.custom", "x");
    const string expected = "a.custom=x,k8s.container.name=web,k8s.pod.name=web-1";
    K8SAGENT_TEST_EQUAL(expected, ResourceMapToStr(res));
    K8SAGENT_TEST_EQUAL(expected, ResourceMapToStr(res));

    // Insertion order does not matter.
    ResourceMap reversed;
    reversed.Set("a.custom", "x");
    reversed.Set("k8s.pod.name", "web-1");
    reversed.Set("k8s.container.name", "web");
    K8SAGENT_TEST_EQUAL(expected, ResourceMapToStr(reversed));
}

TEST_F(ResourceMapUnittest, TestParseDeclaredResourceKeys) {
    K8SAGENT_TEST_TRUE(ParseDeclaredResourceKeys("").empty());

    set<string> keys = ParseDeclaredResourceKeys("k8s.pod.name=web, service.version =1.0,,broken,a=b=c,team=shop");
    K8SAGENT_TEST_EQUAL(3U, keys.size());
    K8SAGENT_TEST_TRUE(keys.count("k8s.pod.name") == 1);
    K8SAGENT_TEST_TRUE(keys.count("service.version ") == 1);
    K8SAGENT_TEST_TRUE(keys.count("team") == 1);
    K8SAGENT_TEST_TRUE(keys.count("broken") == 0);
    K8SAGENT_TEST_TRUE(keys.count("a") == 0);
}

TEST_F(ResourceMapUnittest, TestCreateServiceInstanceId) {
    K8SAGENT_TEST_EQUAL("shop.web-1.web", CreateServiceInstanceId("shop", "web-1", "web"));
    K8SAGENT_TEST_EQUAL("", CreateServiceInstanceId("", "web-1", "web"));
    K8SAGENT_TEST_EQUAL("", CreateServiceInstanceId("shop", "", "web"));
    K8SAGENT_TEST_EQUAL("", CreateServiceInstanceId("shop", "web-1", ""));
}

} // namespace k8sagent

UNIT_TEST_MAIN
