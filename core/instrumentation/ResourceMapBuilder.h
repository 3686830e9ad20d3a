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
#include <set>
#include <string>

#include "instrumentation/Instrumentation.h"
#include "instrumentation/ResourceMap.h"
#include "metadata/OwnerResolver.h"
#include "models/K8sObjects.h"

namespace k8sagent {

// Keys already present in OTEL_RESOURCE_ATTRIBUTES of the container at @index.
std::set<std::string> GetDeclaredResourceKeys(const Pod& pod, size_t index);

// Resource attributes for the container at @index of @pod.
// Precedence, first wins:
//   1. keys already declared in the container's OTEL_RESOURCE_ATTRIBUTES, never emitted again;
//   2. spec.resource.attributes of @instrumentation;
//   3. namespace, container, pod, node and service.instance.id of the pod, then the
//      workload owners found by @resolver. Empty values are left out.
ResourceMap BuildResourceMap(const Instrumentation& instrumentation,
                             const Namespace& k8sNamespace,
                             const Pod& pod,
                             size_t index,
                             const OwnerResolver& resolver);

} // namespace k8sagent
