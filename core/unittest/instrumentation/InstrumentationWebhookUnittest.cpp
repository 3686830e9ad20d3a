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
#include "instrumentation/Instrumentation.h"
#include "instrumentation/InstrumentationWebhook.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class InstrumentationWebhookUnittest : public ::testing::Test {
public:
    void TestParseInstrumentation();
    void TestParseInvalidInstrumentation();
    void TestDefault();
    void TestValidate();
    void TestValidateOperations();

private:
    InstrumentationWebhook mWebhook;
};

static const string kInstrumentationJson = R"({
    "apiVersion": "newrelic.com/v1alpha1",
    "kind": "Instrumentation",
    "metadata": {
        "name": "newrelic-instrumentation",
        "namespace": "newrelic",
        "annotations": {
            "instrumentation.newrelic.com/default-auto-instrumentation-python-image": "newrelic/python:latest"
        }
    },
    "spec": {
        "exporter": {"endpoint": "http://otlp:4317"},
        "resource": {"resourceAttributes": {"team": "shop"}, "addK8sUIDAttributes": true},
        "propagators": ["tracecontext", "baggage", "b3"],
        "sampler": {"type": "parentbased_traceidratio", "argument": "0.25"},
        "env": [{"name": "NEW_RELIC_LOG_LEVEL", "value": "info"}],
        "java": {"image": "newrelic/java:latest", "env": [{"name": "NEW_RELIC_DISTRIBUTED_TRACING_ENABLED", "value": "true"}]},
        "go": {"image": "newrelic/go:latest"}
    }
})";

static Instrumentation ParseInstrumentation(const string& content) {
    Json::Value root;
    string errorMsg;
    Instrumentation instrumentation;
    EXPECT_TRUE(ParseJsonTable(content, root, errorMsg)) << errorMsg;
    EXPECT_TRUE(InstrumentationFromJson(root, instrumentation, errorMsg)) << errorMsg;
    return instrumentation;
}

void InstrumentationWebhookUnittest::TestParseInstrumentation() {
    Instrumentation inst = ParseInstrumentation(kInstrumentationJson);
    K8SAGENT_TEST_EQUAL("newrelic-instrumentation", inst.metadata.name);
    K8SAGENT_TEST_EQUAL("http://otlp:4317", inst.spec.exporter.endpoint);
    K8SAGENT_TEST_EQUAL("shop", inst.spec.resource.attributes["team"]);
    K8SAGENT_TEST_TRUE(inst.spec.resource.addK8sUIDAttributes);
    vector<Propagator> propagators{Propagator::TraceContext, Propagator::Baggage, Propagator::B3};
    K8SAGENT_TEST_TRUE(propagators == inst.spec.propagators);
    K8SAGENT_TEST_EQUAL("parentbased_traceidratio", inst.spec.sampler.type);
    K8SAGENT_TEST_EQUAL("0.25", inst.spec.sampler.argument);
    K8SAGENT_TEST_EQUAL_FATAL(1U, inst.spec.env.size());
    K8SAGENT_TEST_EQUAL("NEW_RELIC_LOG_LEVEL", inst.spec.env[0].name);
    K8SAGENT_TEST_EQUAL("newrelic/java:latest", inst.spec.GetLanguageSpec(Language::Java).image);
    K8SAGENT_TEST_EQUAL(1U, inst.spec.GetLanguageSpec(Language::Java).env.size());
    K8SAGENT_TEST_EQUAL("newrelic/go:latest", inst.spec.GetLanguageSpec(Language::Go).image);
    K8SAGENT_TEST_EQUAL("", inst.spec.GetLanguageSpec(Language::Python).image);
}

void InstrumentationWebhookUnittest::TestParseInvalidInstrumentation() {
    Json::Value root;
    string errorMsg;
    Instrumentation inst;
    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(R"({"spec": {"propagators": ["tracecontext", "w3c"]}})", root, errorMsg));
    K8SAGENT_TEST_FALSE(InstrumentationFromJson(root, inst, errorMsg));
    K8SAGENT_TEST_EQUAL("unknown propagator w3c", errorMsg);

    K8SAGENT_TEST_TRUE_FATAL(ParseJsonTable(R"({"spec": {"resource": {"resourceAttributes": {"n": 1}}}})", root, errorMsg));
    Instrumentation other;
    K8SAGENT_TEST_FALSE(InstrumentationFromJson(root, other, errorMsg));
    K8SAGENT_TEST_EQUAL("value of resourceAttributes.n is not a string", errorMsg);
}

void InstrumentationWebhookUnittest::TestDefault() {
    Instrumentation inst = ParseInstrumentation(kInstrumentationJson);
    mWebhook.Default(inst);
    K8SAGENT_TEST_EQUAL("k8s-agents-operator", inst.metadata.labels["app.kubernetes.io/managed-by"]);
    K8SAGENT_TEST_EQUAL("newrelic/python:latest", inst.spec.GetLanguageSpec(Language::Python).image);
    // Configured images are kept, languages without annotation stay empty.
    K8SAGENT_TEST_EQUAL("newrelic/java:latest", inst.spec.GetLanguageSpec(Language::Java).image);
    K8SAGENT_TEST_EQUAL("", inst.spec.GetLanguageSpec(Language::NodeJS).image);

    inst.metadata.labels["app.kubernetes.io/managed-by"] = "helm";
    mWebhook.Default(inst);
    K8SAGENT_TEST_EQUAL("helm", inst.metadata.labels["app.kubernetes.io/managed-by"]);
}

void InstrumentationWebhookUnittest::TestValidate() {
    Instrumentation inst = ParseInstrumentation(kInstrumentationJson);
    string errorMsg;
    K8SAGENT_TEST_TRUE(mWebhook.Validate(inst, errorMsg));

    inst.spec.env.push_back(MakeEnvVar("JAVA_TOOL_OPTIONS", "-javaagent"));
    K8SAGENT_TEST_FALSE(mWebhook.Validate(inst, errorMsg));
    K8SAGENT_TEST_EQUAL("env name should start with \"NEW_RELIC_\" or \"OTEL_\": JAVA_TOOL_OPTIONS", errorMsg);

    inst.spec.env.pop_back();
    inst.spec.MutableLanguageSpec(Language::Php).env.push_back(MakeEnvVar("PHP_INI_SCAN_DIR", "/etc"));
    K8SAGENT_TEST_FALSE(mWebhook.Validate(inst, errorMsg));
    K8SAGENT_TEST_EQUAL("env name should start with \"NEW_RELIC_\" or \"OTEL_\": PHP_INI_SCAN_DIR", errorMsg);
}

void InstrumentationWebhookUnittest::TestValidateOperations() {
    Instrumentation valid = ParseInstrumentation(kInstrumentationJson);
    Instrumentation invalid = valid;
    invalid.spec.env.push_back(MakeEnvVar("LD_PRELOAD", "x"));
    string errorMsg;
    K8SAGENT_TEST_TRUE(mWebhook.ValidateCreate(valid, errorMsg));
    K8SAGENT_TEST_FALSE(mWebhook.ValidateCreate(invalid, errorMsg));
    K8SAGENT_TEST_TRUE(mWebhook.ValidateUpdate(valid, invalid, errorMsg));
    K8SAGENT_TEST_FALSE(mWebhook.ValidateUpdate(invalid, valid, errorMsg));
    K8SAGENT_TEST_TRUE(mWebhook.ValidateDelete(invalid, errorMsg));
    K8SAGENT_TEST_TRUE(errorMsg.empty());
}

UNIT_TEST_CASE(InstrumentationWebhookUnittest, TestParseInstrumentation)
UNIT_TEST_CASE(InstrumentationWebhookUnittest, TestParseInvalidInstrumentation)
UNIT_TEST_CASE(InstrumentationWebhookUnittest, TestDefault)
UNIT_TEST_CASE(InstrumentationWebhookUnittest, TestValidate)
UNIT_TEST_CASE(InstrumentationWebhookUnittest, TestValidateOperations)

} // namespace k8sagent

UNIT_TEST_MAIN
