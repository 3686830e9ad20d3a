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
#include <json/json.h>

#include <string>
#include <vector>

#include "instrumentation/Instrumentation.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// One offline injection: the pod to mutate, its namespace, the target container
// and the instrumentation chosen for each language. ReplicaSets listed here
// answer the owner lookups when the kube-apiserver is not used.
struct InjectionRequest {
    Namespace k8sNamespace;
    Pod pod;
    std::string containerName;
    LanguageInstrumentations instrumentations;
    std::vector<ReplicaSet> replicaSets;
};

// {"namespace": {...}, "pod": {...}, "containerName": "...",
//  "instrumentations": {"java": {...}, ...}, "replicaSets": [...]}
bool InjectionRequestFromJson(const Json::Value& json, InjectionRequest& request, std::string& errorMsg);

} // namespace k8sagent
