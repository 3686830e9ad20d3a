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

#include "application/Application.h"
#include "common/JsonUtil.h"
#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

static const char* kRequest = R"({
    "namespace": {"metadata": {"name": "shop"}},
    "pod": {
        "metadata": {"name": "web-7d4b9c-x2x5z", "namespace": "shop", "labels": {"app": "web"},
                     "ownerReferences": [{"apiVersion": "apps/v1", "kind": "ReplicaSet", "name": "web-7d4b9c", "uid": "rs-uid"}]},
        "spec": {
            "nodeName": "node-1",
            "restartPolicy": "Always",
            "containers": [
                {"name": "app", "image": "registry.local/web:1.4.2", "ports": [{"containerPort": 8080}]},
                {"name": "envoy", "image": "envoyproxy/envoy:v1.29"}
            ]
        }
    },
    "containerName": "app",
    "instrumentations": {
        "java": {
            "metadata": {"name": "newrelic-java"},
            "spec": {"java": {"image": "newrelic/newrelic-java-init:latest", "env": [{"name": "JAVA_TOOL_OPTIONS", "value": "-javaagent:/nr.jar"}]}}
        },
        "python": {
            "metadata": {"name": "newrelic-python",
                         "annotations": {"instrumentation.newrelic.com/default-auto-instrumentation-python-image": "newrelic/newrelic-python-init:latest"}},
            "spec": {"python": {"env": [{"name": "NEW_RELIC_PYTHON_ENABLED", "value": "true"}]},
                     "exporter": {"endpoint": "http://otel-collector:4317"}}
        }
    },
    "replicaSets": [
        {"metadata": {"name": "web-7d4b9c", "ownerReferences": [{"kind": "Deployment", "name": "web", "uid": "dep-uid"}]}}
    ]
})";

class ApplicationUnittest : public ::testing::Test {
public:
    void TestProcess();
    void TestRun();
    void TestRunBadRequest();

protected:
    void TearDown() override {
        STRING_FLAG(request_file) = "";
        STRING_FLAG(output_file) = "";
    }

    static const EnvVar* FindEnv(const Container& container, const string& name) {
        auto idx = GetIndexOfEnv(container.env, name);
        return idx ? &container.env[*idx] : nullptr;
    }

    TemporaryDirectory mTmpDir{"k8sagent_application"};
    string mRequestFile = mTmpDir.File("request.json");
    string mOutputFile = mTmpDir.File("pod.json");
};

void ApplicationUnittest::TestProcess() {
    Json::Value root;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(kRequest, root, errorMsg));
    InjectionRequest request;
    K8SAGENT_TEST_TRUE_FATAL(InjectionRequestFromJson(root, request, errorMsg));

    Pod pod = Application::GetInstance()->Process(request);
    // JAVA_TOOL_OPTIONS fails validation, so java is dropped and python goes in.
    K8SAGENT_TEST_FALSE(request.instrumentations[Language::Java].has_value());
    K8SAGENT_TEST_EQUAL("newrelic/newrelic-python-init:latest", request.instrumentations[Language::Python]->spec.python.image);

    K8SAGENT_TEST_EQUAL_FATAL(2U, pod.spec.containers.size());
    const Container& app = pod.spec.containers[0];
    K8SAGENT_TEST_EQUAL("python", FindEnv(app, ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_TRUE(FindEnv(app, "JAVA_TOOL_OPTIONS") == nullptr);
    K8SAGENT_TEST_EQUAL("web", FindEnv(app, ENV_NEW_RELIC_APP_NAME)->value);
    K8SAGENT_TEST_EQUAL("http://otel-collector:4317", FindEnv(app, ENV_OTEL_EXPORTER_OTLP_ENDPOINT)->value);
    K8SAGENT_TEST_EQUAL(ENV_OTEL_RESOURCE_ATTRIBUTES, app.env.back().name);
    K8SAGENT_TEST_TRUE(pod.spec.containers[1].env.empty());
}

void ApplicationUnittest::TestRun() {
    ofstream(mRequestFile) << kRequest;
    STRING_FLAG(request_file) = mRequestFile;
    STRING_FLAG(output_file) = mOutputFile;
    K8SAGENT_TEST_EQUAL(0, Application::GetInstance()->Run());

    Json::Value out;
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(LoadJsonFile(mOutputFile, out, errorMsg));
    // Fields the injector does not model are written back.
    K8SAGENT_TEST_EQUAL("Always", out["spec"]["restartPolicy"].asString());
    K8SAGENT_TEST_EQUAL(8080, out["spec"]["containers"][0]["ports"][0]["containerPort"].asInt());
    K8SAGENT_TEST_EQUAL("web", out["metadata"]["labels"]["app"].asString());

    Pod pod;
    K8SAGENT_TEST_TRUE_FATAL(PodFromJson(out, pod, errorMsg));
    K8SAGENT_TEST_EQUAL("python", FindEnv(pod.spec.containers[0], ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_TRUE(MakeSecretKeyRefEnvVar(ENV_NEW_RELIC_LICENSE_KEY, "newrelic-key-secret", "new_relic_license_key", true)
                       == *FindEnv(pod.spec.containers[0], ENV_NEW_RELIC_LICENSE_KEY));
}

void ApplicationUnittest::TestRunBadRequest() {
    K8SAGENT_TEST_EQUAL(1, Application::GetInstance()->Run());

    STRING_FLAG(request_file) = mTmpDir.File("absent.json");
    K8SAGENT_TEST_EQUAL(1, Application::GetInstance()->Run());

    ofstream(mRequestFile) << "{\"namespace\": ";
    STRING_FLAG(request_file) = mRequestFile;
    K8SAGENT_TEST_EQUAL(1, Application::GetInstance()->Run());

    ofstream(mRequestFile) << R"({"namespace": {}, "pod": {}, "instrumentations": {"ruby": {}}})";
    K8SAGENT_TEST_EQUAL(1, Application::GetInstance()->Run());

    ofstream(mRequestFile) << R"({"namespace": {}, "pod": {}})";
    STRING_FLAG(output_file) = (mTmpDir.Path() / "missing_dir" / "pod.json").string();
    K8SAGENT_TEST_EQUAL(1, Application::GetInstance()->Run());
    K8SAGENT_TEST_FALSE(bfs::exists(mTmpDir.Path() / "missing_dir"));
}

UNIT_TEST_CASE(ApplicationUnittest, TestProcess)
UNIT_TEST_CASE(ApplicationUnittest, TestRun)
UNIT_TEST_CASE(ApplicationUnittest, TestRunBadRequest)

} // namespace k8sagent

UNIT_TEST_MAIN
