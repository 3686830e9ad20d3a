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

#include "instrumentation/ResourceMap.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// Service name reported by the agent: the first non-empty of deployment,
// statefulset, job, cronjob and pod name in @resources, else the name of the
// container at @index.
std::string ChooseServiceName(const Pod& pod, const ResourceMap& resources, size_t index);

// Tag of the image of the container at @index, empty when the image is untagged.
// "registry:5000/app" is untagged, the last ':' belongs to the registry port.
std::string ChooseServiceVersion(const Pod& pod, size_t index);

} // namespace k8sagent
