// Copyright 2024 k8s-agents-injector Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "instrumentation/SdkInjector.h"

#include <set>
#include <utility>
#include <vector>

#include "apm/GoAgentInjector.h"
#include "apm/InProcessAgentInjector.h"
#include "common/StringTools.h"
#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"
#include "instrumentation/ResourceMap.h"
#include "instrumentation/ResourceMapBuilder.h"
#include "instrumentation/ServiceIdentity.h"
#include "logger/Logger.h"

using namespace std;

namespace k8sagent {

SdkInjector::SdkInjector(K8sObjectLookup* lookup, const InjectorOptions& options)
    : mOptions(options), mOwnerResolver(lookup, options.ownerLookupBackoff, options.ownerResolveMaxDepth) {
    RegisterDefaultAgentInjectors();
}

SdkInjector::SdkInjector(K8sObjectLookup* lookup, const InjectorOptions& options, OwnerResolver::Sleeper sleeper)
    : mOptions(options),
      mOwnerResolver(lookup, options.ownerLookupBackoff, options.ownerResolveMaxDepth, std::move(sleeper)) {
    RegisterDefaultAgentInjectors();
}

void SdkInjector::RegisterDefaultAgentInjectors() {
    for (auto language : AllLanguages()) {
        if (language == Language::Go) {
            mAgentInjectors[language] = make_unique<GoAgentInjector>();
        } else {
            mAgentInjectors[language] = make_unique<InProcessAgentInjector>(language);
        }
    }
}

void SdkInjector::SetAgentInjector(Language language, unique_ptr<AgentInjector> injector) {
    mAgentInjectors[language] = std::move(injector);
}

size_t SdkInjector::GetContainerIndex(const string& containerName, const Pod& pod) {
    size_t index = 0;
    for (size_t i = 0; i < pod.spec.containers.size(); ++i) {
        if (pod.spec.containers[i].name == containerName) {
            index = i;
        }
    }
    return index;
}

string SdkInjector::GetGoContainerName(const Namespace& k8sNamespace, const Pod& pod) const {
    const string& key = mOptions.goContainerNamesAnnotation;
    string names;
    auto it = pod.metadata.annotations.find(key);
    if (it != pod.metadata.annotations.end()) {
        names = it->second;
    } else {
        it = k8sNamespace.metadata.annotations.find(key);
        if (it != k8sNamespace.metadata.annotations.end()) {
            names = it->second;
        }
    }
    // Only one container can be instrumented with the go agent.
    return TrimString(SplitString(names, ",")[0]);
}

Pod SdkInjector::Inject(const LanguageInstrumentations& instrumentations,
                        const Namespace& k8sNamespace,
                        Pod pod,
                        const string& containerName) const {
    if (pod.spec.containers.empty()) {
        return pod;
    }
    const size_t index = GetContainerIndex(containerName, pod);

    for (auto language : AllLanguages()) {
        auto instIt = instrumentations.find(language);
        if (instIt == instrumentations.end() || !instIt->second) {
            continue;
        }
        const Instrumentation& instrumentation = *instIt->second;
        const string& languageName = LanguageName(language);
        auto injectorIt = mAgentInjectors.find(language);
        if (injectorIt == mAgentInjectors.end() || !injectorIt->second) {
            LOG_WARNING(sLogger,
                        ("skip agent injection", "no agent injector")("language", languageName)(
                            "namespace", k8sNamespace.metadata.name)("pod", pod.metadata.name));
            continue;
        }

        size_t appIndex = index;
        if (language == Language::Go) {
            appIndex = GetContainerIndex(GetGoContainerName(k8sNamespace, pod), pod);
        }
        LOG_DEBUG(sLogger,
                  ("inject instrumentation into pod", languageName)("instrumentation namespace",
                                                                    instrumentation.metadata.k8sNamespace)(
                      "instrumentation name", instrumentation.metadata.name)("namespace", k8sNamespace.metadata.name)(
                      "pod", pod.metadata.name)("container", pod.spec.containers[appIndex].name));

        Pod injected = pod;
        string errorMsg;
        if (!injectorIt->second->Inject(instrumentation.spec.GetLanguageSpec(language), injected, appIndex, errorMsg)) {
            LOG_INFO(sLogger,
                     ("skip agent injection", languageName)("reason", errorMsg)("namespace", k8sNamespace.metadata.name)(
                         "pod", pod.metadata.name)("container", pod.spec.containers[appIndex].name));
            continue;
        }
        size_t agentIndex = appIndex;
        if (language == Language::Go) {
            agentIndex = injected.spec.containers.size() - 1;
        }
        InjectCommonEnvVar(instrumentation, injected, agentIndex);
        InjectCommonConfig(instrumentation, k8sNamespace, injected, agentIndex, appIndex);
        pod = std::move(injected);
        LOG_INFO(sLogger,
                 ("agent injected", languageName)("namespace", k8sNamespace.metadata.name)("pod", pod.metadata.name)(
                     "container", pod.spec.containers[agentIndex].name));
    }
    return pod;
}

void SdkInjector::InjectCommonEnvVar(const Instrumentation& instrumentation, Pod& pod, size_t agentIndex) const {
    Container& container = pod.spec.containers[agentIndex];
    for (const auto& env : instrumentation.spec.env) {
        InsertEnvIfAbsent(container.env, env);
    }
}

void SdkInjector::InjectCommonConfig(const Instrumentation& instrumentation,
                                     const Namespace& k8sNamespace,
                                     Pod& pod,
                                     size_t agentIndex,
                                     size_t appIndex) const {
    const InstrumentationSpec& spec = instrumentation.spec;
    ResourceMap resources = BuildResourceMap(instrumentation, k8sNamespace, pod, appIndex, mOwnerResolver);
    const set<string> declared = GetDeclaredResourceKeys(pod, agentIndex);
    const string serviceName = ChooseServiceName(pod, resources, appIndex);
    const string serviceVersion = ChooseServiceVersion(pod, appIndex);

    vector<EnvVar>& envs = pod.spec.containers[agentIndex].env;
    InsertEnvIfAbsent(envs, MakeEnvVar(ENV_NEW_RELIC_APP_NAME, serviceName));
    InsertEnvIfAbsent(envs, MakeEnvVar(ENV_OTEL_SERVICE_NAME, serviceName));
    InsertEnvIfAbsent(
        envs,
        MakeSecretKeyRefEnvVar(ENV_NEW_RELIC_LICENSE_KEY, mOptions.licenseSecretName, mOptions.licenseSecretKey, true));
    InsertEnvIfAbsent(envs, MakeEnvVar(ENV_NEW_RELIC_LABELS, mOptions.labels));
    if (!spec.exporter.endpoint.empty()) {
        InsertEnvIfAbsent(envs, MakeEnvVar(ENV_OTEL_EXPORTER_OTLP_ENDPOINT, spec.exporter.endpoint));
    }

    // Attributes unknown at admission time are resolved by the kubelet through the downward API.
    auto addFieldRef = [&](ResourceAttributeKey key, const string& envName, const string& fieldPath) {
        const string& attr = ResourceAttributeName(key);
        if (resources.Contains(attr) || declared.find(attr) != declared.end()) {
            return;
        }
        InsertEnvIfAbsent(envs, MakeFieldRefEnvVar(envName, fieldPath));
        resources.Set(attr, "$(" + envName + ")");
    };
    addFieldRef(ResourceAttributeKey::K8sPodName, ENV_POD_NAME, FIELD_PATH_POD_NAME);
    if (spec.resource.addK8sUIDAttributes) {
        addFieldRef(ResourceAttributeKey::K8sPodUid, ENV_POD_UID, FIELD_PATH_POD_UID);
    }
    addFieldRef(ResourceAttributeKey::K8sNodeName, ENV_NODE_NAME, FIELD_PATH_NODE_NAME);

    const string& versionAttr = ResourceAttributeName(ResourceAttributeKey::ServiceVersion);
    if (!serviceVersion.empty() && !resources.Contains(versionAttr) && declared.find(versionAttr) == declared.end()) {
        resources.Set(versionAttr, serviceVersion);
    }

    // The app container's keys are excluded by BuildResourceMap, the agent container may declare others.
    for (const auto& key : declared) {
        resources.Erase(key);
    }
    const string resStr = ResourceMapToStr(resources);
    auto resIdx = GetIndexOfEnv(envs, ENV_OTEL_RESOURCE_ATTRIBUTES);
    if (!resIdx) {
        if (!resStr.empty()) {
            envs.push_back(MakeEnvVar(ENV_OTEL_RESOURCE_ATTRIBUTES, resStr));
        }
    } else if (!resStr.empty()) {
        string& value = envs[*resIdx].value;
        if (!value.empty() && !EndWith(value, ",")) {
            value += ",";
        }
        value += resStr;
    }

    if (!spec.propagators.empty() && !GetIndexOfEnv(envs, ENV_OTEL_PROPAGATORS)) {
        vector<string> names;
        for (auto propagator : spec.propagators) {
            names.push_back(PropagatorName(propagator));
        }
        envs.push_back(MakeEnvVar(ENV_OTEL_PROPAGATORS, JoinString(names, ",")));
    }

    // The sampler is only configured when neither of its variables is set.
    if (!spec.sampler.type.empty() && !GetIndexOfEnv(envs, ENV_OTEL_TRACES_SAMPLER)
        && !GetIndexOfEnv(envs, ENV_OTEL_TRACES_SAMPLER_ARG)) {
        envs.push_back(MakeEnvVar(ENV_OTEL_TRACES_SAMPLER, spec.sampler.type));
        if (!spec.sampler.argument.empty()) {
            envs.push_back(MakeEnvVar(ENV_OTEL_TRACES_SAMPLER_ARG, spec.sampler.argument));
        }
    }

    // OTEL_RESOURCE_ATTRIBUTES references other variables as $(NAME), those have to be defined before it.
    MoveEnvToListEnd(envs, GetIndexOfEnv(envs, ENV_OTEL_RESOURCE_ATTRIBUTES));
}

} // namespace k8sagent
