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

#include "apm/GoAgentInjector.h"
#include "apm/InProcessAgentInjector.h"
#include "constants/EnvConstants.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class AgentInjectorUnittest : public ::testing::Test {
public:
    void TestInProcessInject();
    void TestInProcessErrors();
    void TestInProcessSameLanguageAgain();
    void TestGoInject();
    void TestGoErrors();

protected:
    static Pod MakePod() {
        Pod pod;
        Container app;
        app.name = "app";
        app.image = "registry.local/web:1.4.2";
        app.env.push_back(MakeEnvVar("NODE_OPTIONS", "--max-old-space-size=256"));
        pod.spec.containers.push_back(app);
        return pod;
    }

    static LanguageSpec MakeSpec(const string& image, const vector<EnvVar>& env) {
        LanguageSpec spec;
        spec.image = image;
        spec.env = env;
        return spec;
    }
};

void AgentInjectorUnittest::TestInProcessInject() {
    InProcessAgentInjector injector(Language::NodeJS);
    K8SAGENT_TEST_EQUAL("nodejs", injector.Name());

    Pod pod = MakePod();
    string errorMsg;
    LanguageSpec spec = MakeSpec("newrelic/newrelic-node-init:latest",
                                 {MakeEnvVar("NODE_OPTIONS", "--require /newrelic-instrumentation/newrelicinit.js"),
                                  MakeEnvVar("NEW_RELIC_NODE_AGENT", "true")});
    K8SAGENT_TEST_TRUE_FATAL(injector.Inject(spec, pod, 0, errorMsg));

    const vector<EnvVar>& envs = pod.spec.containers[0].env;
    K8SAGENT_TEST_EQUAL_FATAL(3U, envs.size());
    K8SAGENT_TEST_TRUE(MakeEnvVar("NODE_OPTIONS", "--max-old-space-size=256") == envs[0]);
    K8SAGENT_TEST_TRUE(MakeEnvVar("NEW_RELIC_NODE_AGENT", "true") == envs[1]);
    K8SAGENT_TEST_TRUE(MakeEnvVar(ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE, "nodejs") == envs[2]);
}

void AgentInjectorUnittest::TestInProcessErrors() {
    InProcessAgentInjector injector(Language::Python);
    string errorMsg;

    Pod pod = MakePod();
    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("newrelic/newrelic-python-init:latest", {}), pod, 1, errorMsg));
    K8SAGENT_TEST_EQUAL("container index 1 out of range", errorMsg);

    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("", {}), pod, 0, errorMsg));
    K8SAGENT_TEST_EQUAL("python agent image is not set", errorMsg);

    pod.spec.containers[0].env.push_back(MakeEnvVar(ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE, "dotnet"));
    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("newrelic/newrelic-python-init:latest", {}), pod, 0, errorMsg));
    K8SAGENT_TEST_EQUAL("container app is already instrumented with dotnet", errorMsg);
}

void AgentInjectorUnittest::TestInProcessSameLanguageAgain() {
    InProcessAgentInjector injector(Language::Php);
    LanguageSpec spec = MakeSpec("newrelic/newrelic-php-init:latest", {MakeEnvVar("PHP_INI_SCAN_DIR", "/nr")});
    Pod pod = MakePod();
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(injector.Inject(spec, pod, 0, errorMsg));
    const vector<EnvVar> once = pod.spec.containers[0].env;
    K8SAGENT_TEST_TRUE(injector.Inject(spec, pod, 0, errorMsg));
    K8SAGENT_TEST_TRUE(once == pod.spec.containers[0].env);
}

void AgentInjectorUnittest::TestGoInject() {
    GoAgentInjector injector;
    K8SAGENT_TEST_EQUAL("go", injector.Name());

    Pod pod = MakePod();
    const Container app = pod.spec.containers[0];
    string errorMsg;
    K8SAGENT_TEST_TRUE_FATAL(
        injector.Inject(MakeSpec("newrelic/newrelic-go-init:latest", {MakeEnvVar("NEW_RELIC_GO_EBPF", "true")}), pod, 0, errorMsg));

    K8SAGENT_TEST_EQUAL_FATAL(2U, pod.spec.containers.size());
    K8SAGENT_TEST_TRUE(app == pod.spec.containers[0]);
    const Container& sidecar = pod.spec.containers[1];
    K8SAGENT_TEST_EQUAL("newrelic-go-agent", sidecar.name);
    K8SAGENT_TEST_EQUAL("newrelic/newrelic-go-init:latest", sidecar.image);
    K8SAGENT_TEST_EQUAL_FATAL(2U, sidecar.env.size());
    K8SAGENT_TEST_TRUE(MakeEnvVar("NEW_RELIC_GO_EBPF", "true") == sidecar.env[0]);
    K8SAGENT_TEST_TRUE(MakeEnvVar(ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE, "go") == sidecar.env[1]);
}

void AgentInjectorUnittest::TestGoErrors() {
    GoAgentInjector injector;
    string errorMsg;

    Pod empty;
    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("newrelic/newrelic-go-init:latest", {}), empty, 0, errorMsg));
    K8SAGENT_TEST_EQUAL("pod has no container", errorMsg);

    Pod pod = MakePod();
    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("", {}), pod, 0, errorMsg));
    K8SAGENT_TEST_EQUAL("go agent image is not set", errorMsg);

    K8SAGENT_TEST_TRUE(injector.Inject(MakeSpec("newrelic/newrelic-go-init:latest", {}), pod, 0, errorMsg));
    K8SAGENT_TEST_FALSE(injector.Inject(MakeSpec("newrelic/newrelic-go-init:latest", {}), pod, 0, errorMsg));
    K8SAGENT_TEST_EQUAL("container newrelic-go-agent already exists", errorMsg);
    K8SAGENT_TEST_EQUAL(2U, pod.spec.containers.size());
}

UNIT_TEST_CASE(AgentInjectorUnittest, TestInProcessInject)
UNIT_TEST_CASE(AgentInjectorUnittest, TestInProcessErrors)
UNIT_TEST_CASE(AgentInjectorUnittest, TestInProcessSameLanguageAgain)
UNIT_TEST_CASE(AgentInjectorUnittest, TestGoInject)
UNIT_TEST_CASE(AgentInjectorUnittest, TestGoErrors)

} // namespace k8sagent

UNIT_TEST_MAIN
