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

#include <fstream>

#include "metadata/KubeApiObjectLookup.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class KubeApiObjectLookupUnittest : public ::testing::Test {
public:
    void TestReplicaSetPath();
    void TestUnknownHost();
    void TestMissingToken();
    void TestHostFromEnv();

protected:
    TemporaryDirectory mTmpDir{"k8sagent_kube_api"};
};

void KubeApiObjectLookupUnittest::TestReplicaSetPath() {
    K8SAGENT_TEST_EQUAL("/apis/apps/v1/namespaces/shop/replicasets/web-7d4b9c",
                        KubeApiObjectLookup::ReplicaSetPath("shop", "web-7d4b9c"));
}

void KubeApiObjectLookupUnittest::TestUnknownHost() {
    KubeApiObjectLookup lookup("", 443, mTmpDir.File("token"), mTmpDir.File("ca.crt"), 1);
    ReplicaSet replicaSet;
    string errorMsg;
    K8SAGENT_TEST_TRUE(LookupStatus::kError == lookup.GetReplicaSet("shop", "web-7d4b9c", replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL("kube-apiserver host is unknown", errorMsg);
}

void KubeApiObjectLookupUnittest::TestMissingToken() {
    const string tokenPath = mTmpDir.File("token");
    KubeApiObjectLookup lookup("127.0.0.1", 6443, tokenPath, mTmpDir.File("ca.crt"), 1);
    ReplicaSet replicaSet;
    string errorMsg;
    K8SAGENT_TEST_TRUE(LookupStatus::kError == lookup.GetReplicaSet("shop", "web-7d4b9c", replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL("failed to open service account token: " + tokenPath, errorMsg);

    ofstream(tokenPath) << " \n";
    K8SAGENT_TEST_TRUE(LookupStatus::kError == lookup.GetReplicaSet("shop", "web-7d4b9c", replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL("service account token is empty: " + tokenPath, errorMsg);
}

void KubeApiObjectLookupUnittest::TestHostFromEnv() {
    SetEnv("KUBERNETES_SERVICE_HOST", "10.0.0.1");
    SetEnv("KUBERNETES_SERVICE_PORT", "6443");
    KubeApiObjectLookup fromEnv;
    K8SAGENT_TEST_EQUAL("10.0.0.1", fromEnv.GetHost());
    K8SAGENT_TEST_EQUAL(6443, fromEnv.GetPort());

    SetEnv("KUBERNETES_SERVICE_PORT", "https");
    KubeApiObjectLookup badPort;
    K8SAGENT_TEST_EQUAL(443, badPort.GetPort());

    STRING_FLAG(kube_apiserver_host) = "apiserver.local";
    INT32_FLAG(kube_apiserver_port) = 8443;
    KubeApiObjectLookup fromFlags;
    K8SAGENT_TEST_EQUAL("apiserver.local", fromFlags.GetHost());
    K8SAGENT_TEST_EQUAL(8443, fromFlags.GetPort());

    STRING_FLAG(kube_apiserver_host) = "";
    INT32_FLAG(kube_apiserver_port) = 0;
    UnsetEnv("KUBERNETES_SERVICE_HOST");
    UnsetEnv("KUBERNETES_SERVICE_PORT");
}

UNIT_TEST_CASE(KubeApiObjectLookupUnittest, TestReplicaSetPath)
UNIT_TEST_CASE(KubeApiObjectLookupUnittest, TestUnknownHost)
UNIT_TEST_CASE(KubeApiObjectLookupUnittest, TestMissingToken)
UNIT_TEST_CASE(KubeApiObjectLookupUnittest, TestHostFromEnv)

} // namespace k8sagent

UNIT_TEST_MAIN
