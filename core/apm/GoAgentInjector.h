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
#include <string>

#include "apm/AgentInjector.h"

namespace k8sagent {

// The Go agent runs out of process, in a sidecar named newrelic-go-agent that is
// appended as the last container of the pod. @index is not used, the sidecar
// serves the whole pod.
class GoAgentInjector : public AgentInjector {
public:
    const std::string& Name() const override { return LanguageName(Language::Go); }
    bool Inject(const LanguageSpec& spec, Pod& pod, size_t index, std::string& errorMsg) override;
};

} // namespace k8sagent
