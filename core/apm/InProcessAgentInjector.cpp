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

#include "apm/InProcessAgentInjector.h"

#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"

using namespace std;

namespace k8sagent {

InProcessAgentInjector::InProcessAgentInjector(Language language) : mLanguage(language) {
}

bool InProcessAgentInjector::Inject(const LanguageSpec& spec, Pod& pod, size_t index, string& errorMsg) {
    if (index >= pod.spec.containers.size()) {
        errorMsg = "container index " + to_string(index) + " out of range";
        return false;
    }
    if (spec.image.empty()) {
        errorMsg = Name() + " agent image is not set";
        return false;
    }
    Container& container = pod.spec.containers[index];
    auto markerIdx = GetIndexOfEnv(container.env, ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE);
    if (markerIdx && container.env[*markerIdx].value != Name()) {
        errorMsg = "container " + container.name + " is already instrumented with "
            + container.env[*markerIdx].value;
        return false;
    }
    for (const auto& env : spec.env) {
        InsertEnvIfAbsent(container.env, env);
    }
    InsertEnvIfAbsent(container.env, MakeEnvVar(ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE, Name()));
    return true;
}

} // namespace k8sagent
