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

#include "instrumentation/ServiceIdentity.h"

#include <vector>

using namespace std;

namespace k8sagent {

string ChooseServiceName(const Pod& pod, const ResourceMap& resources, size_t index) {
    static const vector<ResourceAttributeKey> sNameKeys = {
        ResourceAttributeKey::K8sDeploymentName,
        ResourceAttributeKey::K8sStatefulSetName,
        ResourceAttributeKey::K8sJobName,
        ResourceAttributeKey::K8sCronJobName,
        ResourceAttributeKey::K8sPodName,
    };
    for (auto key : sNameKeys) {
        const string& name = resources.Get(key);
        if (!name.empty()) {
            return name;
        }
    }
    if (index >= pod.spec.containers.size()) {
        return "";
    }
    return pod.spec.containers[index].name;
}

string ChooseServiceVersion(const Pod& pod, size_t index) {
    if (index >= pod.spec.containers.size()) {
        return "";
    }
    const string& image = pod.spec.containers[index].image;
    size_t pos = image.rfind(':');
    string tag = image.substr(pos == string::npos ? 0 : pos + 1);
    if (tag.find('/') != string::npos) {
        return "";
    }
    return tag;
}

} // namespace k8sagent
