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

#include "application/InjectionRequest.h"

#include "common/JsonUtil.h"

using namespace std;

namespace k8sagent {

bool InjectionRequestFromJson(const Json::Value& json, InjectionRequest& request, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "request is not an object";
        return false;
    }
    if (!NamespaceFromJson(json["namespace"], request.k8sNamespace, errorMsg)) {
        errorMsg = "invalid namespace: " + errorMsg;
        return false;
    }
    if (!PodFromJson(json["pod"], request.pod, errorMsg)) {
        errorMsg = "invalid pod: " + errorMsg;
        return false;
    }
    if (json.isMember("containerName") && !json["containerName"].isString()) {
        errorMsg = "containerName is not a string";
        return false;
    }
    request.containerName = GetStringValue(json, "containerName");

    const Json::Value& instrumentations = json["instrumentations"];
    if (!instrumentations.isNull()) {
        if (!instrumentations.isObject()) {
            errorMsg = "instrumentations is not an object";
            return false;
        }
        for (const auto& name : instrumentations.getMemberNames()) {
            Language language;
            if (!LanguageFromName(name, language)) {
                errorMsg = "unknown language " + name;
                return false;
            }
            const Json::Value& item = instrumentations[name];
            if (item.isNull()) {
                request.instrumentations[language] = nullopt;
                continue;
            }
            Instrumentation instrumentation;
            if (!InstrumentationFromJson(item, instrumentation, errorMsg)) {
                errorMsg = "invalid " + name + " instrumentation: " + errorMsg;
                return false;
            }
            request.instrumentations[language] = std::move(instrumentation);
        }
    }

    const Json::Value& replicaSets = json["replicaSets"];
    if (!replicaSets.isNull()) {
        if (!replicaSets.isArray()) {
            errorMsg = "replicaSets is not an array";
            return false;
        }
        for (const auto& item : replicaSets) {
            ReplicaSet replicaSet;
            if (!ReplicaSetFromJson(item, replicaSet, errorMsg)) {
                errorMsg = "invalid replicaset: " + errorMsg;
                return false;
            }
            // A listed ReplicaSet without namespace lives beside the pod.
            if (replicaSet.metadata.k8sNamespace.empty()) {
                replicaSet.metadata.k8sNamespace = request.k8sNamespace.metadata.name;
            }
            request.replicaSets.push_back(std::move(replicaSet));
        }
    }
    return true;
}

} // namespace k8sagent
