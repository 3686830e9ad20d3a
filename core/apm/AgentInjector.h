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

#include "instrumentation/Instrumentation.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// Prepares one language agent for a container of a pod.
//
// On success the pod may have been changed (env vars, extra containers). On
// failure @errorMsg tells why, and the caller must discard the pod it passed in.
class AgentInjector {
public:
    virtual ~AgentInjector() = default;

    virtual const std::string& Name() const = 0;
    virtual bool Inject(const LanguageSpec& spec, Pod& pod, size_t index, std::string& errorMsg) = 0;
};

} // namespace k8sagent
