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
#include <utility>

#include "models/K8sObjects.h"

namespace k8sagent {

enum class LookupStatus {
    kOk,
    kNotFound,
    kError,
};

const char* LookupStatusToString(LookupStatus status);

// Read access to cluster objects the ownership resolver can not see on the pod.
class K8sObjectLookup {
public:
    virtual ~K8sObjectLookup() = default;

    virtual LookupStatus GetReplicaSet(const std::string& k8sNamespace,
                                       const std::string& name,
                                       ReplicaSet& replicaSet,
                                       std::string& errorMsg)
        = 0;
};

// Serves ReplicaSets from memory, keyed by namespace and name.
class StaticObjectLookup : public K8sObjectLookup {
public:
    void AddReplicaSet(const ReplicaSet& replicaSet);

    LookupStatus GetReplicaSet(const std::string& k8sNamespace,
                               const std::string& name,
                               ReplicaSet& replicaSet,
                               std::string& errorMsg) override;

private:
    std::map<std::pair<std::string, std::string>, ReplicaSet> mReplicaSets;
};

} // namespace k8sagent
