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

// Agents loaded inside the application process (java, nodejs, python, dotnet,
// php). Only the env vars of the language block are applied, together with the
// NEW_RELIC_INSTRUMENTATION_LANGUAGE marker. A container carries at most one
// in-process agent.
class InProcessAgentInjector : public AgentInjector {
public:
    explicit InProcessAgentInjector(Language language);

    const std::string& Name() const override { return LanguageName(mLanguage); }
    bool Inject(const LanguageSpec& spec, Pod& pod, size_t index, std::string& errorMsg) override;

private:
    Language mLanguage;
};

} // namespace k8sagent
