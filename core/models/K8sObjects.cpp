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

#include "models/K8sObjects.h"

#include "common/JsonUtil.h"

using namespace std;

namespace k8sagent {

bool operator==(const ObjectFieldSelector& lhs, const ObjectFieldSelector& rhs) {
    return lhs.fieldPath == rhs.fieldPath;
}

bool operator==(const SecretKeySelector& lhs, const SecretKeySelector& rhs) {
    return lhs.name == rhs.name && lhs.key == rhs.key && lhs.optional == rhs.optional;
}

bool operator==(const EnvVarSource& lhs, const EnvVarSource& rhs) {
    return lhs.fieldRef == rhs.fieldRef && lhs.secretKeyRef == rhs.secretKeyRef;
}

bool operator==(const EnvVar& lhs, const EnvVar& rhs) {
    return lhs.name == rhs.name && lhs.value == rhs.value && lhs.valueFrom == rhs.valueFrom;
}

bool operator!=(const EnvVar& lhs, const EnvVar& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Container& lhs, const Container& rhs) {
    return lhs.name == rhs.name && lhs.image == rhs.image && lhs.env == rhs.env;
}

EnvVar MakeEnvVar(const string& name, const string& value) {
    EnvVar env;
    env.name = name;
    env.value = value;
    return env;
}

EnvVar MakeFieldRefEnvVar(const string& name, const string& fieldPath) {
    EnvVar env;
    env.name = name;
    env.valueFrom = EnvVarSource();
    env.valueFrom->fieldRef = ObjectFieldSelector{fieldPath};
    return env;
}

EnvVar MakeSecretKeyRefEnvVar(const string& name, const string& secretName, const string& key, bool optional) {
    EnvVar env;
    env.name = name;
    env.valueFrom = EnvVarSource();
    env.valueFrom->secretKeyRef = SecretKeySelector{secretName, key, optional};
    return env;
}

static bool IsObjectOrNull(const Json::Value& json) {
    return json.isNull() || json.isObject();
}

bool EnvVarFromJson(const Json::Value& json, EnvVar& env, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "env var is not an object";
        return false;
    }
    env.name = GetStringValue(json, "name");
    if (env.name.empty()) {
        errorMsg = "env var name is empty";
        return false;
    }
    env.value = GetStringValue(json, "value");
    if (json.isMember("valueFrom")) {
        const Json::Value& from = json["valueFrom"];
        if (!from.isObject()) {
            errorMsg = "valueFrom of env var " + env.name + " is not an object";
            return false;
        }
        EnvVarSource source;
        source.raw = from;
        if (from.isMember("fieldRef")) {
            source.fieldRef = ObjectFieldSelector{GetStringValue(from["fieldRef"], "fieldPath")};
        }
        if (from.isMember("secretKeyRef")) {
            const Json::Value& ref = from["secretKeyRef"];
            SecretKeySelector selector;
            selector.name = GetStringValue(ref, "name");
            selector.key = GetStringValue(ref, "key");
            if (ref.isObject() && ref.isMember("optional") && ref["optional"].isBool()) {
                selector.optional = ref["optional"].asBool();
            }
            source.secretKeyRef = selector;
        }
        env.valueFrom = source;
    }
    return true;
}

bool EnvVarsFromJson(const Json::Value& json, vector<EnvVar>& envs, string& errorMsg) {
    if (json.isNull()) {
        return true;
    }
    if (!json.isArray()) {
        errorMsg = "env is not an array";
        return false;
    }
    for (const auto& item : json) {
        EnvVar env;
        if (!EnvVarFromJson(item, env, errorMsg)) {
            return false;
        }
        envs.push_back(std::move(env));
    }
    return true;
}

bool ContainerFromJson(const Json::Value& json, Container& container, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "container is not an object";
        return false;
    }
    container.raw = json;
    container.name = GetStringValue(json, "name");
    container.image = GetStringValue(json, "image");
    if (!EnvVarsFromJson(json["env"], container.env, errorMsg)) {
        errorMsg = "container " + container.name + ": " + errorMsg;
        return false;
    }
    return true;
}

bool ObjectMetaFromJson(const Json::Value& json, ObjectMeta& meta, string& errorMsg) {
    if (!IsObjectOrNull(json)) {
        errorMsg = "metadata is not an object";
        return false;
    }
    meta.raw = json;
    meta.name = GetStringValue(json, "name");
    meta.k8sNamespace = GetStringValue(json, "namespace");
    meta.uid = GetStringValue(json, "uid");
    if (!GetStringMap(json, "labels", meta.labels, errorMsg)
        || !GetStringMap(json, "annotations", meta.annotations, errorMsg)) {
        return false;
    }
    if (json.isObject() && json.isMember("ownerReferences")) {
        const Json::Value& owners = json["ownerReferences"];
        if (!owners.isArray()) {
            errorMsg = "ownerReferences is not an array";
            return false;
        }
        for (const auto& item : owners) {
            OwnerReference owner;
            owner.raw = item;
            owner.apiVersion = GetStringValue(item, "apiVersion");
            owner.kind = GetStringValue(item, "kind");
            owner.name = GetStringValue(item, "name");
            owner.uid = GetStringValue(item, "uid");
            meta.ownerReferences.push_back(std::move(owner));
        }
    }
    return true;
}

bool PodFromJson(const Json::Value& json, Pod& pod, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "pod is not an object";
        return false;
    }
    pod.raw = json;
    if (!ObjectMetaFromJson(json["metadata"], pod.metadata, errorMsg)) {
        return false;
    }
    const Json::Value& spec = json["spec"];
    if (!IsObjectOrNull(spec)) {
        errorMsg = "pod spec is not an object";
        return false;
    }
    pod.spec.raw = spec;
    pod.spec.nodeName = GetStringValue(spec, "nodeName");
    if (spec.isObject() && spec.isMember("containers")) {
        if (!spec["containers"].isArray()) {
            errorMsg = "pod spec containers is not an array";
            return false;
        }
        for (const auto& item : spec["containers"]) {
            Container container;
            if (!ContainerFromJson(item, container, errorMsg)) {
                return false;
            }
            pod.spec.containers.push_back(std::move(container));
        }
    }
    return true;
}

bool NamespaceFromJson(const Json::Value& json, Namespace& ns, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "namespace is not an object";
        return false;
    }
    ns.raw = json;
    return ObjectMetaFromJson(json["metadata"], ns.metadata, errorMsg);
}

bool ReplicaSetFromJson(const Json::Value& json, ReplicaSet& rs, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "replicaset is not an object";
        return false;
    }
    rs.raw = json;
    return ObjectMetaFromJson(json["metadata"], rs.metadata, errorMsg);
}

Json::Value EnvVarToJson(const EnvVar& env) {
    Json::Value json(Json::objectValue);
    json["name"] = env.name;
    if (!env.value.empty() || !env.valueFrom) {
        json["value"] = env.value;
    }
    if (env.valueFrom) {
        Json::Value from = env.valueFrom->raw.isObject() ? env.valueFrom->raw : Json::Value(Json::objectValue);
        if (env.valueFrom->fieldRef) {
            from["fieldRef"]["fieldPath"] = env.valueFrom->fieldRef->fieldPath;
        }
        if (env.valueFrom->secretKeyRef) {
            const auto& ref = *env.valueFrom->secretKeyRef;
            from["secretKeyRef"]["name"] = ref.name;
            from["secretKeyRef"]["key"] = ref.key;
            if (ref.optional) {
                from["secretKeyRef"]["optional"] = *ref.optional;
            }
        }
        json["valueFrom"] = from;
    }
    return json;
}

Json::Value EnvVarsToJson(const vector<EnvVar>& envs) {
    Json::Value json(Json::arrayValue);
    for (const auto& env : envs) {
        json.append(EnvVarToJson(env));
    }
    return json;
}

Json::Value ContainerToJson(const Container& container) {
    Json::Value json = container.raw.isObject() ? container.raw : Json::Value(Json::objectValue);
    json["name"] = container.name;
    if (!container.image.empty()) {
        json["image"] = container.image;
    }
    if (container.env.empty()) {
        json.removeMember("env");
    } else {
        json["env"] = EnvVarsToJson(container.env);
    }
    return json;
}

Json::Value ObjectMetaToJson(const ObjectMeta& meta) {
    Json::Value json = meta.raw.isObject() ? meta.raw : Json::Value(Json::objectValue);
    if (!meta.name.empty()) {
        json["name"] = meta.name;
    }
    if (!meta.k8sNamespace.empty()) {
        json["namespace"] = meta.k8sNamespace;
    }
    if (!meta.uid.empty()) {
        json["uid"] = meta.uid;
    }
    if (!meta.labels.empty()) {
        Json::Value labels(Json::objectValue);
        for (const auto& kv : meta.labels) {
            labels[kv.first] = kv.second;
        }
        json["labels"] = labels;
    }
    if (!meta.annotations.empty()) {
        Json::Value annotations(Json::objectValue);
        for (const auto& kv : meta.annotations) {
            annotations[kv.first] = kv.second;
        }
        json["annotations"] = annotations;
    }
    if (!meta.ownerReferences.empty()) {
        Json::Value owners(Json::arrayValue);
        for (const auto& owner : meta.ownerReferences) {
            Json::Value item = owner.raw.isObject() ? owner.raw : Json::Value(Json::objectValue);
            item["apiVersion"] = owner.apiVersion;
            item["kind"] = owner.kind;
            item["name"] = owner.name;
            item["uid"] = owner.uid;
            owners.append(item);
        }
        json["ownerReferences"] = owners;
    }
    return json;
}

Json::Value PodToJson(const Pod& pod) {
    Json::Value json = pod.raw.isObject() ? pod.raw : Json::Value(Json::objectValue);
    json["metadata"] = ObjectMetaToJson(pod.metadata);
    Json::Value spec = pod.spec.raw.isObject() ? pod.spec.raw : Json::Value(Json::objectValue);
    if (!pod.spec.nodeName.empty()) {
        spec["nodeName"] = pod.spec.nodeName;
    }
    Json::Value containers(Json::arrayValue);
    for (const auto& container : pod.spec.containers) {
        containers.append(ContainerToJson(container));
    }
    spec["containers"] = containers;
    json["spec"] = spec;
    return json;
}

} // namespace k8sagent
