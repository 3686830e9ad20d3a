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

#pragma once
#include <map>
#include <memory>
#include <string>

#include "apm/AgentInjector.h"
#include "instrumentation/InjectorOptions.h"
#include "instrumentation/Instrumentation.h"
#include "metadata/K8sObjectLookup.h"
#include "metadata/OwnerResolver.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// Applies the configured language agents to one container of a pod and stamps
// the agent configuration (service identity, license key, exporter, resource
// attributes, propagators, sampler) into its env list.
//
// Languages are handled one after another in the order of AllLanguages(). A
// language whose agent can not be prepared is logged and skipped, the pod then
// keeps no change from it. Values already present in the env list always win,
// so injecting an injected pod again changes nothing.
class SdkInjector {
public:
    // @lookup is used to follow ReplicaSets to their Deployment, may be null.
    SdkInjector(K8sObjectLookup* lookup, const InjectorOptions& options);
    SdkInjector(K8sObjectLookup* lookup, const InjectorOptions& options, OwnerResolver::Sleeper sleeper);

    // Replaces the agent injector of @language.
    void SetAgentInjector(Language language, std::unique_ptr<AgentInjector> injector);

    Pod Inject(const LanguageInstrumentations& instrumentations,
               const Namespace& k8sNamespace,
               Pod pod,
               const std::string& containerName) const;

    // Index of the container called @containerName, 0 when there is none.
    static size_t GetContainerIndex(const std::string& containerName, const Pod& pod);

private:
    void RegisterDefaultAgentInjectors();

    // First container listed in the go container names annotation, the pod
    // annotation overrides the namespace one.
    std::string GetGoContainerName(const Namespace& k8sNamespace, const Pod& pod) const;

    void InjectCommonEnvVar(const Instrumentation& instrumentation, Pod& pod, size_t agentIndex) const;
    // @agentIndex is the container running the agent, @appIndex the one producing
    // the telemetry. They only differ for agents running in a sidecar.
    void InjectCommonConfig(const Instrumentation& instrumentation,
                            const Namespace& k8sNamespace,
                            Pod& pod,
                            size_t agentIndex,
                            size_t appIndex) const;

    InjectorOptions mOptions;
    OwnerResolver mOwnerResolver;
    std::map<Language, std::unique_ptr<AgentInjector>> mAgentInjectors;

#ifdef K8SAGENT_UNIT_TEST_MAIN
    friend class SdkInjectorUnittest;
#endif
};

} // namespace k8sagent
