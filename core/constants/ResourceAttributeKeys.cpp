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

#include "constants/ResourceAttributeKeys.h"

namespace k8sagent {

const std::string& ResourceAttributeName(ResourceAttributeKey key) {
    static const std::string sK8sNamespaceName = "k8s.namespace.name";
    static const std::string sK8sContainerName = "k8s.container.name";
    static const std::string sK8sPodName = "k8s.pod.name";
    static const std::string sK8sPodUid = "k8s.pod.uid";
    static const std::string sK8sNodeName = "k8s.node.name";
    static const std::string sK8sReplicaSetName = "k8s.replicaset.name";
    static const std::string sK8sReplicaSetUid = "k8s.replicaset.uid";
    static const std::string sK8sDeploymentName = "k8s.deployment.name";
    static const std::string sK8sDeploymentUid = "k8s.deployment.uid";
    static const std::string sK8sStatefulSetName = "k8s.statefulset.name";
    static const std::string sK8sStatefulSetUid = "k8s.statefulset.uid";
    static const std::string sK8sDaemonSetName = "k8s.daemonset.name";
    static const std::string sK8sDaemonSetUid = "k8s.daemonset.uid";
    static const std::string sK8sJobName = "k8s.job.name";
    static const std::string sK8sJobUid = "k8s.job.uid";
    static const std::string sK8sCronJobName = "k8s.cronjob.name";
    static const std::string sK8sCronJobUid = "k8s.cronjob.uid";
    static const std::string sServiceInstanceId = "service.instance.id";
    static const std::string sServiceVersion = "service.version";

    switch (key) {
        case ResourceAttributeKey::K8sNamespaceName:
            return sK8sNamespaceName;
        case ResourceAttributeKey::K8sContainerName:
            return sK8sContainerName;
        case ResourceAttributeKey::K8sPodName:
            return sK8sPodName;
        case ResourceAttributeKey::K8sPodUid:
            return sK8sPodUid;
        case ResourceAttributeKey::K8sNodeName:
            return sK8sNodeName;
        case ResourceAttributeKey::K8sReplicaSetName:
            return sK8sReplicaSetName;
        case ResourceAttributeKey::K8sReplicaSetUid:
            return sK8sReplicaSetUid;
        case ResourceAttributeKey::K8sDeploymentName:
            return sK8sDeploymentName;
        case ResourceAttributeKey::K8sDeploymentUid:
            return sK8sDeploymentUid;
        case ResourceAttributeKey::K8sStatefulSetName:
            return sK8sStatefulSetName;
        case ResourceAttributeKey::K8sStatefulSetUid:
            return sK8sStatefulSetUid;
        case ResourceAttributeKey::K8sDaemonSetName:
            return sK8sDaemonSetName;
        case ResourceAttributeKey::K8sDaemonSetUid:
            return sK8sDaemonSetUid;
        case ResourceAttributeKey::K8sJobName:
            return sK8sJobName;
        case ResourceAttributeKey::K8sJobUid:
            return sK8sJobUid;
        case ResourceAttributeKey::K8sCronJobName:
            return sK8sCronJobName;
        case ResourceAttributeKey::K8sCronJobUid:
            return sK8sCronJobUid;
        case ResourceAttributeKey::ServiceInstanceId:
            return sServiceInstanceId;
        case ResourceAttributeKey::ServiceVersion:
            break;
    }
    return sServiceVersion;
}

} // namespace k8sagent
