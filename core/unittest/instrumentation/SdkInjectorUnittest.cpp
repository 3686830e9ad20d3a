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
#include <memory>
#include <string>
#include <vector>

#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"
#include "instrumentation/SdkInjector.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

// Changes the pod and then reports a failure.
class FailingAgentInjector : public AgentInjector {
public:
    const string& Name() const override {
        static const string sName = "failing";
        return sName;
    }

    bool Inject(const LanguageSpec&, Pod& pod, size_t index, string& errorMsg) override {
        ++mCalls;
        pod.spec.containers[index].env.push_back(MakeEnvVar("HALF_DONE", "true"));
        pod.spec.containers.push_back(Container());
        errorMsg = "agent files are missing";
        return false;
    }

    uint32_t mCalls = 0;
};

class NotFoundObjectLookup : public K8sObjectLookup {
public:
    LookupStatus
    GetReplicaSet(const string& k8sNamespace, const string& name, ReplicaSet&, string& errorMsg) override {
        ++mCalls;
        errorMsg = "replicasets \"" + name + "\" not found in " + k8sNamespace;
        return LookupStatus::kNotFound;
    }

    uint32_t mCalls = 0;
};

class SdkInjectorUnittest : public ::testing::Test {
public:
    void TestGetContainerIndex();
    void TestJavaInjection();
    void TestInjectTwiceChangesNothing();
    void TestExistingValuesWin();
    void TestPodTemplatePlaceholders();
    void TestPodUidPlaceholder();
    void TestGoSidecar();
    void TestGoSidecarDeclaredKeysWin();
    void TestGoContainerName();
    void TestFailedAgentLeavesPodUntouched();
    void TestSecondInProcessAgentSkipped();
    void TestUnknownContainerUsesFirst();
    void TestReplicaSetNeverFound();

protected:
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

        mNamespace.metadata.name = "shop";
    }

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
        app.env.push_back(MakeEnvVar("NEW_RELIC_LOG_LEVEL", "debug"));
        pod.spec.containers.push_back(app);
        return pod;
    }

    static Instrumentation MakeJavaInstrumentation() {
        Instrumentation inst;
        inst.metadata.name = "newrelic-java";
        inst.metadata.k8sNamespace = "newrelic";
        inst.spec.java.image = "newrelic/newrelic-java-init:latest";
        inst.spec.java.env.push_back(MakeEnvVar("JAVA_TOOL_OPTIONS", "-javaagent:/newrelic-instrumentation/newrelic-agent.jar"));
        inst.spec.env.push_back(MakeEnvVar("NEW_RELIC_DISTRIBUTED_TRACING_ENABLED", "true"));
        inst.spec.exporter.endpoint = "http://otel-collector:4317";
        inst.spec.resource.attributes["team"] = "payments";
        inst.spec.propagators = {Propagator::TraceContext, Propagator::Baggage};
        inst.spec.sampler.type = "parentbased_traceidratio";
        inst.spec.sampler.argument = "0.25";
        return inst;
    }

    static Instrumentation MakeGoInstrumentation() {
        Instrumentation inst;
        inst.metadata.name = "newrelic-go";
        inst.spec.go.image = "newrelic/newrelic-go-init:latest";
        inst.spec.go.env.push_back(MakeEnvVar("NEW_RELIC_GO_EBPF", "true"));
        return inst;
    }

    SdkInjector MakeInjector() {
        return SdkInjector(&mLookup, InjectorOptions(), [](chrono::milliseconds) {});
    }

    static const EnvVar* FindEnv(const Container& container, const string& name) {
        auto idx = GetIndexOfEnv(container.env, name);
        return idx ? &container.env[*idx] : nullptr;
    }

    static vector<string> EnvNames(const Container& container) {
        vector<string> names;
        for (const auto& env : container.env) {
            names.push_back(env.name);
        }
        return names;
    }

    StaticObjectLookup mLookup;
    Namespace mNamespace;
};

void SdkInjectorUnittest::TestGetContainerIndex() {
    Pod pod;
    for (const string& name : {"init", "app", "init"}) {
        Container container;
        container.name = name;
        pod.spec.containers.push_back(container);
    }
    K8SAGENT_TEST_EQUAL(1U, SdkInjector::GetContainerIndex("app", pod));
    K8SAGENT_TEST_EQUAL(2U, SdkInjector::GetContainerIndex("init", pod));
    K8SAGENT_TEST_EQUAL(0U, SdkInjector::GetContainerIndex("missing", pod));
    K8SAGENT_TEST_EQUAL(0U, SdkInjector::GetContainerIndex("", Pod()));
}

void SdkInjectorUnittest::TestJavaInjection() {
    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();

    Pod pod = MakeInjector().Inject(insts, mNamespace, MakePod(), "app");
    K8SAGENT_TEST_EQUAL_FATAL(1U, pod.spec.containers.size());
    const Container& app = pod.spec.containers[0];

    vector<string> expectedNames = {"NEW_RELIC_LOG_LEVEL",
                                    "JAVA_TOOL_OPTIONS",
                                    "NEW_RELIC_INSTRUMENTATION_LANGUAGE",
                                    "NEW_RELIC_DISTRIBUTED_TRACING_ENABLED",
                                    "NEW_RELIC_APP_NAME",
                                    "OTEL_SERVICE_NAME",
                                    "NEW_RELIC_LICENSE_KEY",
                                    "NEW_RELIC_LABELS",
                                    "OTEL_EXPORTER_OTLP_ENDPOINT",
                                    "OTEL_PROPAGATORS",
                                    "OTEL_TRACES_SAMPLER",
                                    "OTEL_TRACES_SAMPLER_ARG",
                                    "OTEL_RESOURCE_ATTRIBUTES"};
    K8SAGENT_TEST_EQUAL(expectedNames, EnvNames(app));

    K8SAGENT_TEST_EQUAL("java", FindEnv(app, ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_EQUAL("web", FindEnv(app, ENV_NEW_RELIC_APP_NAME)->value);
    K8SAGENT_TEST_EQUAL("web", FindEnv(app, ENV_OTEL_SERVICE_NAME)->value);
    K8SAGENT_TEST_TRUE(MakeSecretKeyRefEnvVar(ENV_NEW_RELIC_LICENSE_KEY, DEFAULT_LICENSE_SECRET_NAME, DEFAULT_LICENSE_SECRET_KEY, true)
                       == *FindEnv(app, ENV_NEW_RELIC_LICENSE_KEY));
    K8SAGENT_TEST_EQUAL("operator:auto-injection", FindEnv(app, ENV_NEW_RELIC_LABELS)->value);
    K8SAGENT_TEST_EQUAL("http://otel-collector:4317", FindEnv(app, ENV_OTEL_EXPORTER_OTLP_ENDPOINT)->value);
    K8SAGENT_TEST_EQUAL("tracecontext,baggage", FindEnv(app, ENV_OTEL_PROPAGATORS)->value);
    K8SAGENT_TEST_EQUAL("parentbased_traceidratio", FindEnv(app, ENV_OTEL_TRACES_SAMPLER)->value);
    K8SAGENT_TEST_EQUAL("0.25", FindEnv(app, ENV_OTEL_TRACES_SAMPLER_ARG)->value);
    K8SAGENT_TEST_EQUAL("k8s.container.name=app,k8s.deployment.name=web,k8s.namespace.name=shop,"
                        "k8s.node.name=node-1,k8s.pod.name=web-7d4b9c-x2x5z,k8s.pod.uid=pod-uid,"
                        "k8s.replicaset.name=web-7d4b9c,service.instance.id=shop.web-7d4b9c-x2x5z.app,"
                        "service.version=1.4.2,team=payments",
                        FindEnv(app, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);
    // Known pod name and node need no downward API variables.
    K8SAGENT_TEST_TRUE(FindEnv(app, ENV_POD_NAME) == nullptr);
    K8SAGENT_TEST_TRUE(FindEnv(app, ENV_NODE_NAME) == nullptr);
}

void SdkInjectorUnittest::TestInjectTwiceChangesNothing() {
    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    SdkInjector injector = MakeInjector();

    Pod once = injector.Inject(insts, mNamespace, MakePod(), "app");
    Pod twice = injector.Inject(insts, mNamespace, once, "app");
    K8SAGENT_TEST_TRUE(once.spec.containers == twice.spec.containers);

    Pod templatePod = MakePod();
    templatePod.metadata.name.clear();
    templatePod.spec.nodeName.clear();
    once = injector.Inject(insts, mNamespace, templatePod, "app");
    twice = injector.Inject(insts, mNamespace, once, "app");
    K8SAGENT_TEST_TRUE(once.spec.containers == twice.spec.containers);
}

void SdkInjectorUnittest::TestExistingValuesWin() {
    Pod pod = MakePod();
    vector<EnvVar>& envs = pod.spec.containers[0].env;
    envs.push_back(MakeEnvVar("OTEL_SERVICE_NAME", "checkout"));
    envs.push_back(MakeEnvVar("OTEL_RESOURCE_ATTRIBUTES", "team=search,k8s.node.name=edge"));
    envs.push_back(MakeEnvVar("OTEL_PROPAGATORS", "b3"));
    envs.push_back(MakeEnvVar("OTEL_TRACES_SAMPLER_ARG", "0.5"));
    envs.push_back(MakeEnvVar("JAVA_TOOL_OPTIONS", "-Xmx512m"));

    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    pod = MakeInjector().Inject(insts, mNamespace, pod, "app");
    const Container& app = pod.spec.containers[0];

    K8SAGENT_TEST_EQUAL("checkout", FindEnv(app, ENV_OTEL_SERVICE_NAME)->value);
    K8SAGENT_TEST_EQUAL("web", FindEnv(app, ENV_NEW_RELIC_APP_NAME)->value);
    K8SAGENT_TEST_EQUAL("-Xmx512m", FindEnv(app, "JAVA_TOOL_OPTIONS")->value);
    K8SAGENT_TEST_EQUAL("b3", FindEnv(app, ENV_OTEL_PROPAGATORS)->value);
    // Half of a sampler configuration is left as the user wrote it.
    K8SAGENT_TEST_TRUE(FindEnv(app, ENV_OTEL_TRACES_SAMPLER) == nullptr);
    K8SAGENT_TEST_EQUAL("0.5", FindEnv(app, ENV_OTEL_TRACES_SAMPLER_ARG)->value);
    K8SAGENT_TEST_EQUAL("team=search,k8s.node.name=edge,k8s.container.name=app,k8s.deployment.name=web,"
                        "k8s.namespace.name=shop,k8s.pod.name=web-7d4b9c-x2x5z,k8s.pod.uid=pod-uid,"
                        "k8s.replicaset.name=web-7d4b9c,service.instance.id=shop.web-7d4b9c-x2x5z.app,"
                        "service.version=1.4.2",
                        FindEnv(app, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);
    K8SAGENT_TEST_EQUAL(ENV_OTEL_RESOURCE_ATTRIBUTES, app.env.back().name);
}

void SdkInjectorUnittest::TestPodTemplatePlaceholders() {
    Pod pod = MakePod();
    pod.metadata.name.clear();
    pod.metadata.uid.clear();
    pod.spec.nodeName.clear();
    pod.spec.containers[0].image = "registry.local/web";

    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    pod = MakeInjector().Inject(insts, mNamespace, pod, "app");
    const Container& app = pod.spec.containers[0];

    K8SAGENT_TEST_TRUE(MakeFieldRefEnvVar(ENV_POD_NAME, "metadata.name") == *FindEnv(app, ENV_POD_NAME));
    K8SAGENT_TEST_TRUE(MakeFieldRefEnvVar(ENV_NODE_NAME, "spec.nodeName") == *FindEnv(app, ENV_NODE_NAME));
    K8SAGENT_TEST_TRUE(FindEnv(app, ENV_POD_UID) == nullptr);
    K8SAGENT_TEST_EQUAL("k8s.container.name=app,k8s.deployment.name=web,k8s.namespace.name=shop,"
                        "k8s.node.name=$(OTEL_RESOURCE_ATTRIBUTES_NODE_NAME),"
                        "k8s.pod.name=$(OTEL_RESOURCE_ATTRIBUTES_POD_NAME),k8s.replicaset.name=web-7d4b9c,"
                        "team=payments",
                        FindEnv(app, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);
    K8SAGENT_TEST_EQUAL(ENV_OTEL_RESOURCE_ATTRIBUTES, app.env.back().name);
}

void SdkInjectorUnittest::TestPodUidPlaceholder() {
    Pod pod = MakePod();
    pod.metadata.uid.clear();
    Instrumentation inst = MakeJavaInstrumentation();
    inst.spec.resource.addK8sUIDAttributes = true;
    inst.spec.resource.attributes.clear();

    LanguageInstrumentations insts;
    insts[Language::Java] = inst;
    pod = MakeInjector().Inject(insts, mNamespace, pod, "app");
    const Container& app = pod.spec.containers[0];

    K8SAGENT_TEST_TRUE(MakeFieldRefEnvVar(ENV_POD_UID, "metadata.uid") == *FindEnv(app, ENV_POD_UID));
    K8SAGENT_TEST_EQUAL("k8s.container.name=app,k8s.deployment.name=web,k8s.deployment.uid=dep-uid,"
                        "k8s.namespace.name=shop,k8s.node.name=node-1,k8s.pod.name=web-7d4b9c-x2x5z,"
                        "k8s.pod.uid=$(OTEL_RESOURCE_ATTRIBUTES_POD_UID),k8s.replicaset.name=web-7d4b9c,"
                        "k8s.replicaset.uid=rs-uid,service.instance.id=shop.web-7d4b9c-x2x5z.app,"
                        "service.version=1.4.2",
                        FindEnv(app, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);
}

void SdkInjectorUnittest::TestGoSidecar() {
    Pod pod = MakePod();
    Container worker;
    worker.name = "worker";
    worker.image = "registry.local/worker:2.0.1";
    pod.spec.containers.push_back(worker);
    pod.metadata.annotations[ANNOTATION_INJECT_GO_CONTAINER_NAMES] = " worker , app";
    mNamespace.metadata.annotations[ANNOTATION_INJECT_GO_CONTAINER_NAMES] = "app";
    const vector<Container> original = pod.spec.containers;

    LanguageInstrumentations insts;
    insts[Language::Go] = MakeGoInstrumentation();
    SdkInjector injector = MakeInjector();
    Pod once = injector.Inject(insts, mNamespace, pod, "app");

    K8SAGENT_TEST_EQUAL_FATAL(3U, once.spec.containers.size());
    K8SAGENT_TEST_TRUE(original[0] == once.spec.containers[0]);
    K8SAGENT_TEST_TRUE(original[1] == once.spec.containers[1]);
    const Container& sidecar = once.spec.containers[2];
    K8SAGENT_TEST_EQUAL(GO_AGENT_SIDECAR_NAME, sidecar.name);
    K8SAGENT_TEST_EQUAL("newrelic/newrelic-go-init:latest", sidecar.image);
    K8SAGENT_TEST_EQUAL("true", FindEnv(sidecar, "NEW_RELIC_GO_EBPF")->value);
    K8SAGENT_TEST_EQUAL("go", FindEnv(sidecar, ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_EQUAL("web", FindEnv(sidecar, ENV_OTEL_SERVICE_NAME)->value);
    // Telemetry describes the instrumented container, not the sidecar.
    K8SAGENT_TEST_EQUAL("k8s.container.name=worker,k8s.deployment.name=web,k8s.namespace.name=shop,"
                        "k8s.node.name=node-1,k8s.pod.name=web-7d4b9c-x2x5z,k8s.pod.uid=pod-uid,"
                        "k8s.replicaset.name=web-7d4b9c,service.instance.id=shop.web-7d4b9c-x2x5z.worker,"
                        "service.version=2.0.1",
                        FindEnv(sidecar, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);

    Pod twice = injector.Inject(insts, mNamespace, once, "app");
    K8SAGENT_TEST_TRUE(once.spec.containers == twice.spec.containers);
}

void SdkInjectorUnittest::TestGoSidecarDeclaredKeysWin() {
    Instrumentation inst = MakeGoInstrumentation();
    inst.spec.env.push_back(MakeEnvVar(ENV_OTEL_RESOURCE_ATTRIBUTES, "k8s.namespace.name=custom"));

    LanguageInstrumentations insts;
    insts[Language::Go] = inst;
    Pod pod = MakeInjector().Inject(insts, mNamespace, MakePod(), "app");

    K8SAGENT_TEST_EQUAL_FATAL(2U, pod.spec.containers.size());
    const Container& sidecar = pod.spec.containers[1];
    K8SAGENT_TEST_EQUAL(GO_AGENT_SIDECAR_NAME, sidecar.name);
    K8SAGENT_TEST_EQUAL("k8s.namespace.name=custom,k8s.container.name=app,k8s.deployment.name=web,"
                        "k8s.node.name=node-1,k8s.pod.name=web-7d4b9c-x2x5z,k8s.pod.uid=pod-uid,"
                        "k8s.replicaset.name=web-7d4b9c,service.instance.id=shop.web-7d4b9c-x2x5z.app,"
                        "service.version=1.4.2",
                        FindEnv(sidecar, ENV_OTEL_RESOURCE_ATTRIBUTES)->value);
    K8SAGENT_TEST_EQUAL(ENV_OTEL_RESOURCE_ATTRIBUTES, sidecar.env.back().name);
    K8SAGENT_TEST_TRUE(FindEnv(pod.spec.containers[0], ENV_OTEL_RESOURCE_ATTRIBUTES) == nullptr);
}

void SdkInjectorUnittest::TestGoContainerName() {
    SdkInjector injector = MakeInjector();
    Pod pod = MakePod();
    K8SAGENT_TEST_EQUAL("", injector.GetGoContainerName(mNamespace, pod));

    mNamespace.metadata.annotations[ANNOTATION_INJECT_GO_CONTAINER_NAMES] = "api,web";
    K8SAGENT_TEST_EQUAL("api", injector.GetGoContainerName(mNamespace, pod));

    pod.metadata.annotations[ANNOTATION_INJECT_GO_CONTAINER_NAMES] = "  app ";
    K8SAGENT_TEST_EQUAL("app", injector.GetGoContainerName(mNamespace, pod));

    // An empty pod annotation still overrides the namespace.
    pod.metadata.annotations[ANNOTATION_INJECT_GO_CONTAINER_NAMES] = "";
    K8SAGENT_TEST_EQUAL("", injector.GetGoContainerName(mNamespace, pod));
}

void SdkInjectorUnittest::TestFailedAgentLeavesPodUntouched() {
    SdkInjector injector = MakeInjector();
    auto failing = make_unique<FailingAgentInjector>();
    FailingAgentInjector* failingPtr = failing.get();
    injector.SetAgentInjector(Language::NodeJS, std::move(failing));

    Instrumentation nodeInst;
    nodeInst.spec.nodeJS.image = "newrelic/newrelic-node-init:latest";
    LanguageInstrumentations insts;
    insts[Language::NodeJS] = nodeInst;

    const Pod original = MakePod();
    Pod pod = injector.Inject(insts, mNamespace, original, "app");
    K8SAGENT_TEST_EQUAL(1U, failingPtr->mCalls);
    K8SAGENT_TEST_TRUE(original.spec.containers == pod.spec.containers);

    // A later language still runs on the unchanged pod.
    insts[Language::Go] = MakeGoInstrumentation();
    pod = injector.Inject(insts, mNamespace, original, "app");
    K8SAGENT_TEST_EQUAL_FATAL(2U, pod.spec.containers.size());
    K8SAGENT_TEST_TRUE(original.spec.containers[0] == pod.spec.containers[0]);
    K8SAGENT_TEST_EQUAL(GO_AGENT_SIDECAR_NAME, pod.spec.containers[1].name);

    // Missing agent image.
    Instrumentation javaInst = MakeJavaInstrumentation();
    javaInst.spec.java.image.clear();
    LanguageInstrumentations javaOnly;
    javaOnly[Language::Java] = javaInst;
    pod = injector.Inject(javaOnly, mNamespace, original, "app");
    K8SAGENT_TEST_TRUE(original.spec.containers == pod.spec.containers);
}

void SdkInjectorUnittest::TestSecondInProcessAgentSkipped() {
    Instrumentation pythonInst;
    pythonInst.spec.python.image = "newrelic/newrelic-python-init:latest";
    pythonInst.spec.python.env.push_back(MakeEnvVar("PYTHONPATH", "/newrelic-instrumentation"));

    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    insts[Language::Python] = pythonInst;
    insts[Language::Php] = nullopt;

    Pod pod = MakeInjector().Inject(insts, mNamespace, MakePod(), "app");
    const Container& app = pod.spec.containers[0];
    K8SAGENT_TEST_EQUAL("java", FindEnv(app, ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_TRUE(FindEnv(app, "PYTHONPATH") == nullptr);
    K8SAGENT_TEST_TRUE(FindEnv(app, "JAVA_TOOL_OPTIONS") != nullptr);
}

void SdkInjectorUnittest::TestUnknownContainerUsesFirst() {
    Pod pod = MakePod();
    Container sidecar;
    sidecar.name = "envoy";
    pod.spec.containers.push_back(sidecar);

    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    pod = MakeInjector().Inject(insts, mNamespace, pod, "not-there");
    K8SAGENT_TEST_EQUAL("java", FindEnv(pod.spec.containers[0], ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE)->value);
    K8SAGENT_TEST_TRUE(pod.spec.containers[1].env.empty());

    K8SAGENT_TEST_TRUE(MakeInjector().Inject(insts, mNamespace, Pod(), "app").spec.containers.empty());
}

void SdkInjectorUnittest::TestReplicaSetNeverFound() {
    NotFoundObjectLookup lookup;
    uint32_t sleeps = 0;
    SdkInjector injector(&lookup, InjectorOptions(), [&sleeps](chrono::milliseconds) { ++sleeps; });

    LanguageInstrumentations insts;
    insts[Language::Java] = MakeJavaInstrumentation();
    Pod pod = injector.Inject(insts, mNamespace, MakePod(), "app");

    K8SAGENT_TEST_EQUAL(20U, lookup.mCalls);
    K8SAGENT_TEST_EQUAL(19U, sleeps);
    const Container& app = pod.spec.containers[0];
    K8SAGENT_TEST_EQUAL("web-7d4b9c-x2x5z", FindEnv(app, ENV_NEW_RELIC_APP_NAME)->value);
    const string& attrs = FindEnv(app, ENV_OTEL_RESOURCE_ATTRIBUTES)->value;
    K8SAGENT_TEST_TRUE(attrs.find("k8s.replicaset.name=web-7d4b9c") != string::npos);
    K8SAGENT_TEST_TRUE(attrs.find("k8s.deployment.name") == string::npos);
}

UNIT_TEST_CASE(SdkInjectorUnittest, TestGetContainerIndex)
UNIT_TEST_CASE(SdkInjectorUnittest, TestJavaInjection)
UNIT_TEST_CASE(SdkInjectorUnittest, TestInjectTwiceChangesNothing)
UNIT_TEST_CASE(SdkInjectorUnittest, TestExistingValuesWin)
UNIT_TEST_CASE(SdkInjectorUnittest, TestPodTemplatePlaceholders)
UNIT_TEST_CASE(SdkInjectorUnittest, TestPodUidPlaceholder)
UNIT_TEST_CASE(SdkInjectorUnittest, TestGoSidecar)
UNIT_TEST_CASE(SdkInjectorUnittest, TestGoSidecarDeclaredKeysWin)
UNIT_TEST_CASE(SdkInjectorUnittest, TestGoContainerName)
UNIT_TEST_CASE(SdkInjectorUnittest, TestFailedAgentLeavesPodUntouched)
UNIT_TEST_CASE(SdkInjectorUnittest, TestSecondInProcessAgentSkipped)
UNIT_TEST_CASE(SdkInjectorUnittest, TestUnknownContainerUsesFirst)
UNIT_TEST_CASE(SdkInjectorUnittest, TestReplicaSetNeverFound)

} // namespace k8sagent

UNIT_TEST_MAIN
