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

#include "application/InjectionRequest.h"
#include "common/JsonUtil.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class InjectionRequestUnittest : public ::testing::Test {
public:
    void TestParseRequest();
    void TestInvalidRequest();

protected:
    static Json::Value Parse(const string& content) {
        Json::Value root;
        string errorMsg;
        EXPECT_TRUE(ParseJsonTable(content, root, errorMsg)) << errorMsg;
        return root;
    }
};

void InjectionRequestUnittest::TestParseRequest() {
    Json::Value root = Parse(R"({
        "namespace": {"metadata": {"name": "shop", "annotations": {"instrumentation.newrelic.com/go-container-names": "api"}}},
        "pod": {
            "metadata": {"name": "web-7d4b9c-x2x5z", "namespace": "shop",
                         "ownerReferences": [{"apiVersion": "apps/v1", "kind": "ReplicaSet", "name": "web-7d4b9c", "uid": "rs-uid"}]},
            "spec": {"containers": [{"name": "app", "image": "registry.local/web:1.4.2"}]}
        },
        "containerName": "app",
        "instrumentations": {
            "java": {"metadata": {"name": "newrelic-java"}, "spec": {"java": {"image": "newrelic/newrelic-java-init:latest"}}},
            "go": null
        },
        "replicaSets": [
            {"metadata": {"name": "web-7d4b9c", "ownerReferences": [{"kind": "Deployment", "name": "web", "uid": "dep-uid"}]}},
            {"metadata": {"name": "api-5f6c7", "namespace": "edge"}}
        ]
    })");

    InjectionRequest request;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(InjectionRequestFromJson(root, request, errorMsg));
    K8SAGENT_TEST_EQUAL("shop", request.k8sNamespace.metadata.name);
    K8SAGENT_TEST_EQUAL("api", request.k8sNamespace.metadata.annotations["instrumentation.newrelic.com/go-container-names"]);
    K8SAGENT_TEST_EQUAL("web-7d4b9c-x2x5z", request.pod.metadata.name);
    K8SAGENT_TEST_EQUAL(1U, request.pod.spec.containers.size());
    K8SAGENT_TEST_EQUAL("app", request.containerName);

    K8SAGENT_TEST_EQUAL(2U, request.instrumentations.size());
    K8SAGENT_TEST_TRUE_FATAL(request.instrumentations[Language::Java].has_value());
    K8SAGENT_TEST_EQUAL("newrelic/newrelic-java-init:latest", request.instrumentations[Language::Java]->spec.java.image);
    K8SAGENT_TEST_FALSE(request.instrumentations[Language::Go].has_value());

    K8SAGENT_TEST_EQUAL_FATAL(2U, request.replicaSets.size());
    K8SAGENT_TEST_EQUAL("shop", request.replicaSets[0].metadata.k8sNamespace);
    K8SAGENT_TEST_EQUAL("Deployment", request.replicaSets[0].metadata.ownerReferences[0].kind);
    K8SAGENT_TEST_EQUAL("edge", request.replicaSets[1].metadata.k8sNamespace);

    // Only the namespace and the pod are required.
    InjectionRequest minimal;
    K8SAGENT_TEST_TRUE(InjectionRequestFromJson(Parse(R"({"namespace": {}, "pod": {}})"), minimal, errorMsg));
    K8SAGENT_TEST_TRUE(minimal.instrumentations.empty());
    K8SAGENT_TEST_TRUE(minimal.containerName.empty());
}

void InjectionRequestUnittest::TestInvalidRequest() {
    InjectionRequest request;
    string errorMsg;

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(Parse("[]"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("request is not an object", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(Parse(R"({"pod": {}})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("invalid namespace: namespace is not an object", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(Parse(R"({"namespace": {}, "pod": 1})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("invalid pod: pod is not an object", errorMsg);

    K8SAGENT_TEST_FALSE(
        InjectionRequestFromJson(Parse(R"({"namespace": {}, "pod": {}, "containerName": 3})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("containerName is not a string", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(
        Parse(R"({"namespace": {}, "pod": {}, "instrumentations": {"ruby": {}}})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("unknown language ruby", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(
        Parse(R"({"namespace": {}, "pod": {}, "instrumentations": []})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("instrumentations is not an object", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(
        Parse(R"({"namespace": {}, "pod": {}, "replicaSets": {}})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("replicaSets is not an array", errorMsg);

    K8SAGENT_TEST_FALSE(InjectionRequestFromJson(
        Parse(R"({"namespace": {}, "pod": {}, "replicaSets": ["web"]})"), request, errorMsg));
    K8SAGENT_TEST_EQUAL("invalid replicaset: replicaset is not an object", errorMsg);
}

UNIT_TEST_CASE(InjectionRequestUnittest, TestParseRequest)
UNIT_TEST_CASE(InjectionRequestUnittest, TestInvalidRequest)

} // namespace k8sagent

UNIT_TEST_MAIN
