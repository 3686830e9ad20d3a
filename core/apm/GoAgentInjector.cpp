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

#include "apm/GoAgentInjector.h"

#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"

using namespace std;

namespace k8sagent {

bool GoAgentInjector::Inject(const LanguageSpec& spec, Pod& pod, size_t /*index*/, string& errorMsg) {
    if (pod.spec.containers.empty()) {
        errorMsg = "pod has no container";
        return false;
    }
    if (spec.image.empty()) {
        errorMsg = Name() + " agent image is not set";
        return false;
    }
    for (const auto& container : pod.spec.containers) {
        if (container.name == GO_AGENT_SIDECAR_NAME) {
            errorMsg = "container " + GO_AGENT_SIDECAR_NAME + " already exists";
            return false;
        }
    }
    Container sidecar;
    sidecar.name = GO_AGENT_SIDECAR_NAME;
    sidecar.image = spec.image;
    for (const auto& env : spec.env) {
        InsertEnvIfAbsent(sidecar.env, env);
    }
    InsertEnvIfAbsent(sidecar.env, MakeEnvVar(ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE, Name()));
    pod.spec.containers.push_back(std::move(sidecar));
    return true;
}

} // namespace k8sagent
