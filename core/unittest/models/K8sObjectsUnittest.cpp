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

#include "common/JsonUtil.h"
#include "models/K8sObjects.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class K8sObjectsUnittest : public ::testing::Test {
public:
    void TestParsePod();
    void TestParseInvalidPod();
    void TestEncodeKeepsUnknownFields();
    void TestEncodeEnvVarSources();
    void TestParseOwnerReferences();
};

static const string kPodJson = R"({
    "apiVersion": "v1",
    "kind": "Pod",
    "metadata": {
        "name": "web-7d4b9c-x2x5z",
        "namespace": "shop",
        "uid": "pod-uid-1",
        "labels": {"app": "web"},
        "annotations": {"instrumentation.newrelic.com/go-container-names": "api"}
    },
    "spec": {
        "nodeName": "node-1",
        "restartPolicy": "Always",
        "containers": [
            {
                "name": "web",
                "image": "registry:5000/web:1.2.3",
                "ports": [{"containerPort": 8080}],
                "env": [
                    {"name": "PLAIN", "value": "v"},
                    {"name": "POD", "valueFrom": {"fieldRef": {"fieldPath": "metadata.name"}}},
                    {"name": "KEY", "valueFrom": {"secretKeyRef": {"name": "s", "key": "k", "optional": true}}}
                ]
            },
            {"name": "api", "image": "api"}
        ]
    }
})";

void K8sObjectsUnittest::TestParsePod() {
    Json::Value root;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(kPodJson, root, errorMsg));
    Pod pod;
    K8SAGENT_TEST_TRUE_FATAL(PodFromJson(root, pod, errorMsg));
    K8SAGENT_TEST_EQUAL("web-7d4b9c-x2x5z", pod.metadata.name);
    K8SAGENT_TEST_EQUAL("shop", pod.metadata.k8sNamespace);
    K8SAGENT_TEST_EQUAL("pod-uid-1", pod.metadata.uid);
    K8SAGENT_TEST_EQUAL("web", pod.metadata.labels["app"]);
    K8SAGENT_TEST_EQUAL("node-1", pod.spec.nodeName);
    K8SAGENT_TEST_EQUAL_FATAL(2U, pod.spec.containers.size());

    const Container& web = pod.spec.containers[0];
    K8SAGENT_TEST_EQUAL("registry:5000/web:1.2.3", web.image);
    K8SAGENT_TEST_EQUAL_FATAL(3U, web.env.size());
    K8SAGENT_TEST_TRUE(web.env[0] == MakeEnvVar("PLAIN", "v"));
    K8SAGENT_TEST_TRUE(web.env[1] == MakeFieldRefEnvVar("POD", "metadata.name"));
    K8SAGENT_TEST_TRUE(web.env[2] == MakeSecretKeyRefEnvVar("KEY", "s", "k", true));
    K8SAGENT_TEST_TRUE(pod.spec.containers[1].env.empty());
}

void K8sObjectsUnittest::TestParseInvalidPod() {
    string errorMsg;
    Pod pod;
    K8SAGENT_TEST_FALSE(PodFromJson(Json::Value("pod"), pod, errorMsg));
    K8SAGENT_TEST_EQUAL("pod is not an object", errorMsg);

    Json::Value root;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(R"({"spec": {"containers": {"name": "web"}}})", root, errorMsg));
    K8SAGENT_TEST_FALSE(PodFromJson(root, pod, errorMsg));
    K8SAGENT_TEST_EQUAL("pod spec containers is not an array", errorMsg);

    K8SAGENT_TEST_TRUE_FATAL(
        ParseJsonTable(R"({"spec": {"containers": [{"name": "web", "env": [{"value": "x"}]}]}})", root, errorMsg));
    Pod other;
    K8SAGENT_TEST_FALSE(PodFromJson(root, other, errorMsg));
    K8SAGENT_TEST_EQUAL("container web: env var name is empty", errorMsg);
}

void K8sObjectsUnittest::TestEncodeKeepsUnknownFields() {
    Json::Value root;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(kPodJson, root, errorMsg));
    Pod pod;
    K8SAGENT_TEST_TRUE_FATAL(PodFromJson(root, pod, errorMsg));
    pod.spec.containers[0].env.push_back(MakeEnvVar("OTEL_SERVICE_NAME", "web"));

    Json::Value out = PodToJson(pod);
    K8SAGENT_TEST_EQUAL("Pod", out["kind"].asString());
    K8SAGENT_TEST_EQUAL("Always", out["spec"]["restartPolicy"].asString());
    K8SAGENT_TEST_EQUAL(8080, out["spec"]["containers"][0]["ports"][0]["containerPort"].asInt());
    K8SAGENT_TEST_EQUAL(4U, out["spec"]["containers"][0]["env"].size());
    K8SAGENT_TEST_EQUAL("OTEL_SERVICE_NAME", out["spec"]["containers"][0]["env"][3]["name"].asString());
    K8SAGENT_TEST_FALSE(out["spec"]["containers"][1].isMember("env"));

    Pod decoded;
    K8SAGENT_TEST_TRUE_FATAL(PodFromJson(out, decoded, errorMsg));
    K8SAGENT_TEST_TRUE(decoded.spec.containers[0] == pod.spec.containers[0]);
    K8SAGENT_TEST_TRUE(decoded.spec.containers[1] == pod.spec.containers[1]);
}

void K8sObjectsUnittest::TestEncodeEnvVarSources() {
    Json::Value fieldRef = EnvVarToJson(MakeFieldRefEnvVar("OTEL_RESOURCE_ATTRIBUTES_NODE_NAME", "spec.nodeName"));
    K8SAGENT_TEST_FALSE(fieldRef.isMember("value"));
    K8SAGENT_TEST_EQUAL("spec.nodeName", fieldRef["valueFrom"]["fieldRef"]["fieldPath"].asString());

    Json::Value secretRef = EnvVarToJson(
        MakeSecretKeyRefEnvVar("NEW_RELIC_LICENSE_KEY", "newrelic-key-secret", "new_relic_license_key", true));
    K8SAGENT_TEST_EQUAL("newrelic-key-secret", secretRef["valueFrom"]["secretKeyRef"]["name"].asString());
    K8SAGENT_TEST_EQUAL("new_relic_license_key", secretRef["valueFrom"]["secretKeyRef"]["key"].asString());
    K8SAGENT_TEST_TRUE(secretRef["valueFrom"]["secretKeyRef"]["optional"].asBool());

    // An empty literal value is still written.
    Json::Value empty = EnvVarToJson(MakeEnvVar("OTEL_TRACES_SAMPLER_ARG", ""));
    K8SAGENT_TEST_TRUE(empty.isMember("value"));
    K8SAGENT_TEST_EQUAL("", empty["value"].asString());
}

void K8sObjectsUnittest::TestParseOwnerReferences() {
    Json::Value root;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(R"({
        "metadata": {
            "name": "web-7d4b9c",
            "namespace": "shop",
            "ownerReferences": [
                {"apiVersion": "apps/v1", "kind": "Deployment", "name": "web", "uid": "dep-uid", "controller": true}
            ]
        }
    })",
                                            root,
                                            errorMsg));
    ReplicaSet replicaSet;
    K8SAGENT_TEST_TRUE_FATAL(ReplicaSetFromJson(root, replicaSet, errorMsg));
    K8SAGENT_TEST_EQUAL_FATAL(1U, replicaSet.metadata.ownerReferences.size());
    const OwnerReference& owner = replicaSet.metadata.ownerReferences[0];
    K8SAGENT_TEST_EQUAL("apps/v1", owner.apiVersion);
    K8SAGENT_TEST_EQUAL("Deployment", owner.kind);
    K8SAGENT_TEST_EQUAL("web", owner.name);
    K8SAGENT_TEST_EQUAL("dep-uid", owner.uid);

    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(R"({"metadata": {"ownerReferences": {}}})", root, errorMsg));
    ReplicaSet invalid;
    K8SAGENT_TEST_FALSE(ReplicaSetFromJson(root, invalid, errorMsg));
    K8SAGENT_TEST_EQUAL("ownerReferences is not an array", errorMsg);
}

UNIT_TEST_CASE(K8sObjectsUnittest, TestParsePod)
UNIT_TEST_CASE(K8sObjectsUnittest, TestParseInvalidPod)
UNIT_TEST_CASE(K8sObjectsUnittest, TestEncodeKeepsUnknownFields)
UNIT_TEST_CASE(K8sObjectsUnittest, TestEncodeEnvVarSources)
UNIT_TEST_CASE(K8sObjectsUnittest, TestParseOwnerReferences)

} // namespace k8sagent

UNIT_TEST_MAIN
