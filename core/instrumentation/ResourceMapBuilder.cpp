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

#include "instrumentation/ResourceMapBuilder.h"

#include "constants/EnvConstants.h"
#include "instrumentation/EnvListEditor.h"

using namespace std;

namespace k8sagent {

set<string> GetDeclaredResourceKeys(const Pod& pod, size_t index) {
    if (index >= pod.spec.containers.size()) {
        return {};
    }
    const auto& envs = pod.spec.containers[index].env;
    auto idx = GetIndexOfEnv(envs, ENV_OTEL_RESOURCE_ATTRIBUTES);
    if (!idx) {
        return {};
    }
    return ParseDeclaredResourceKeys(envs[*idx].value);
}

ResourceMap BuildResourceMap(const Instrumentation& instrumentation,
                             const Namespace& k8sNamespace,
                             const Pod& pod,
                             size_t index,
                             const OwnerResolver& resolver) {
    ResourceMap res;
    if (index >= pod.spec.containers.size()) {
        return res;
    }
    const set<string> declared = GetDeclaredResourceKeys(pod, index);
    for (const auto& kv : instrumentation.spec.resource.attributes) {
        if (declared.find(kv.first) == declared.end()) {
            res.Set(kv.first, kv.second);
        }
    }

    const string& namespaceName = k8sNamespace.metadata.name;
    const string& containerName = pod.spec.containers[index].name;
    // The pod name and node name are empty while the pod is still a template.
    TopologyAttributes k8sResources;
    k8sResources[ResourceAttributeKey::K8sNamespaceName] = namespaceName;
    k8sResources[ResourceAttributeKey::K8sContainerName] = containerName;
    k8sResources[ResourceAttributeKey::K8sPodName] = pod.metadata.name;
    k8sResources[ResourceAttributeKey::K8sPodUid] = pod.metadata.uid;
    k8sResources[ResourceAttributeKey::K8sNodeName] = pod.spec.nodeName;
    k8sResources[ResourceAttributeKey::ServiceInstanceId]
        = CreateServiceInstanceId(namespaceName, pod.metadata.name, containerName);
    for (const auto& kv : resolver.Resolve(namespaceName, pod.metadata, instrumentation.spec.resource.addK8sUIDAttributes)) {
        k8sResources[kv.first] = kv.second;
    }

    for (const auto& kv : k8sResources) {
        const string& key = ResourceAttributeName(kv.first);
        if (kv.second.empty() || declared.find(key) != declared.end() || res.Contains(key)) {
            continue;
        }
        res.Set(key, kv.second);
    }
    return res;
}

} // namespace k8sagent
