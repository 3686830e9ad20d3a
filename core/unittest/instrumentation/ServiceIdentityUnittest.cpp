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

#include "instrumentation/ServiceIdentity.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class ServiceIdentityUnittest : public ::testing::Test {
public:
    void TestServiceNamePriority();
    void TestServiceNameFallbackToContainer();
    void TestServiceVersion();

protected:
    static Pod MakePod(const string& image) {
        Pod pod;
        Container container;
        container.name = "app";
        container.image = image;
        pod.spec.containers.push_back(container);
        return pod;
    }
};

void ServiceIdentityUnittest::TestServiceNamePriority() {
    Pod pod = MakePod("app:1.0");
    ResourceMap res;
    res.Set(ResourceAttributeKey::K8sPodName, "pod-1");
    K8SAGENT_TEST_EQUAL("pod-1", ChooseServiceName(pod, res, 0));
    res.Set(ResourceAttributeKey::K8sCronJobName, "cron");
    K8SAGENT_TEST_EQUAL("cron", ChooseServiceName(pod, res, 0));
    res.Set(ResourceAttributeKey::K8sJobName, "job");
    K8SAGENT_TEST_EQUAL("job", ChooseServiceName(pod, res, 0));
    res.Set(ResourceAttributeKey::K8sStatefulSetName, "sts");
    K8SAGENT_TEST_EQUAL("sts", ChooseServiceName(pod, res, 0));
    res.Set(ResourceAttributeKey::K8sDeploymentName, "deploy");
    K8SAGENT_TEST_EQUAL("deploy", ChooseServiceName(pod, res, 0));

    // DaemonSet and ReplicaSet names are never used as service name.
    ResourceMap daemon;
    daemon.Set(ResourceAttributeKey::K8sDaemonSetName, "ds");
    daemon.Set(ResourceAttributeKey::K8sReplicaSetName, "rs");
    daemon.Set(ResourceAttributeKey::K8sPodName, "pod-1");
    K8SAGENT_TEST_EQUAL("pod-1", ChooseServiceName(pod, daemon, 0));
}

void ServiceIdentityUnittest::TestServiceNameFallbackToContainer() {
    Pod pod = MakePod("app:1.0");
    ResourceMap res;
    K8SAGENT_TEST_EQUAL("app", ChooseServiceName(pod, res, 0));

    // An unresolved CronJob owner leaves an empty name behind.
    res.Set(ResourceAttributeKey::K8sCronJobName, "");
    res.Set(ResourceAttributeKey::K8sPodName, "");
    K8SAGENT_TEST_EQUAL("app", ChooseServiceName(pod, res, 0));

    K8SAGENT_TEST_EQUAL("", ChooseServiceName(pod, res, 3));
}

void ServiceIdentityUnittest::TestServiceVersion() {
    K8SAGENT_TEST_EQUAL("1.2.3", ChooseServiceVersion(MakePod("app:1.2.3"), 0));
    K8SAGENT_TEST_EQUAL("latest", ChooseServiceVersion(MakePod("docker.io/library/app:latest"), 0));
    K8SAGENT_TEST_EQUAL("2.0", ChooseServiceVersion(MakePod("registry:5000/team/app:2.0"), 0));
    K8SAGENT_TEST_EQUAL("", ChooseServiceVersion(MakePod("registry:5000/app"), 0));
    K8SAGENT_TEST_EQUAL("nginx", ChooseServiceVersion(MakePod("nginx"), 0));
    K8SAGENT_TEST_EQUAL("", ChooseServiceVersion(MakePod(""), 0));
    K8SAGENT_TEST_EQUAL("", ChooseServiceVersion(MakePod("app:1.0"), 1));
}

UNIT_TEST_CASE(ServiceIdentityUnittest, TestServiceNamePriority)
UNIT_TEST_CASE(ServiceIdentityUnittest, TestServiceNameFallbackToContainer)
UNIT_TEST_CASE(ServiceIdentityUnittest, TestServiceVersion)

} // namespace k8sagent

UNIT_TEST_MAIN
