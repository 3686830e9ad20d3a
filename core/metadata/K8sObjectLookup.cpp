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

#include "metadata/K8sObjectLookup.h"

namespace k8sagent {

const char* LookupStatusToString(LookupStatus status) {
    switch (status) {
        case LookupStatus::kOk:
            return "ok";
        case LookupStatus::kNotFound:
            return "not found";
        case LookupStatus::kError:
            break;
    }
    return "error";
}

void StaticObjectLookup::AddReplicaSet(const ReplicaSet& replicaSet) {
    mReplicaSets[{replicaSet.metadata.k8sNamespace, replicaSet.metadata.name}] = replicaSet;
}

LookupStatus StaticObjectLookup::GetReplicaSet(const std::string& k8sNamespace,
                                               const std::string& name,
                                               ReplicaSet& replicaSet,
                                               std::string& errorMsg) {
    auto it = mReplicaSets.find({k8sNamespace, name});
    if (it == mReplicaSets.end()) {
        errorMsg = "replicasets \"" + name + "\" not found";
        return LookupStatus::kNotFound;
    }
    replicaSet = it->second;
    return LookupStatus::kOk;
}

} // namespace k8sagent
