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
#include <string>

namespace k8sagent {

// Resource attribute keys the injector computes itself. User supplied keys are
// free-form strings and never go through this enum.
enum class ResourceAttributeKey {
    K8sNamespaceName,
    K8sContainerName,
    K8sPodName,
    K8sPodUid,
    K8sNodeName,
    K8sReplicaSetName,
    K8sReplicaSetUid,
    K8sDeploymentName,
    K8sDeploymentUid,
    K8sStatefulSetName,
    K8sStatefulSetUid,
    K8sDaemonSetName,
    K8sDaemonSetUid,
    K8sJobName,
    K8sJobUid,
    K8sCronJobName,
    K8sCronJobUid,
    ServiceInstanceId,
    ServiceVersion,
};

// Semantic convention name, e.g. "k8s.pod.name".
const std::string& ResourceAttributeName(ResourceAttributeKey key);

using TopologyAttributes = std::map<ResourceAttributeKey, std::string>;

} // namespace k8sagent
