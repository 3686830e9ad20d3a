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
#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace k8sagent {

// Subset of the core/v1 and apps/v1 types the injector reads or writes. Each
// object keeps the JSON it was decoded from in `raw`, so fields the injector
// does not model survive a decode/encode cycle untouched.

struct ObjectFieldSelector {
    std::string fieldPath;
};

struct SecretKeySelector {
    std::string name;
    std::string key;
    std::optional<bool> optional;
};

struct EnvVarSource {
    std::optional<ObjectFieldSelector> fieldRef;
    std::optional<SecretKeySelector> secretKeyRef;
    Json::Value raw;
};

struct EnvVar {
    std::string name;
    std::string value;
    std::optional<EnvVarSource> valueFrom;
};

struct Container {
    std::string name;
    std::string image;
    std::vector<EnvVar> env;
    Json::Value raw;
};

struct OwnerReference {
    std::string apiVersion;
    std::string kind;
    std::string name;
    std::string uid;
    Json::Value raw;
};

struct ObjectMeta {
    std::string name;
    std::string k8sNamespace;
    std::string uid;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::vector<OwnerReference> ownerReferences;
    Json::Value raw;
};

struct PodSpec {
    std::vector<Container> containers;
    std::string nodeName;
    Json::Value raw;
};

struct Pod {
    ObjectMeta metadata;
    PodSpec spec;
    Json::Value raw;
};

struct Namespace {
    ObjectMeta metadata;
    Json::Value raw;
};

struct ReplicaSet {
    ObjectMeta metadata;
    Json::Value raw;
};

bool operator==(const ObjectFieldSelector& lhs, const ObjectFieldSelector& rhs);
bool operator==(const SecretKeySelector& lhs, const SecretKeySelector& rhs);
bool operator==(const EnvVarSource& lhs, const EnvVarSource& rhs);
bool operator==(const EnvVar& lhs, const EnvVar& rhs);
bool operator!=(const EnvVar& lhs, const EnvVar& rhs);
bool operator==(const Container& lhs, const Container& rhs);

EnvVar MakeEnvVar(const std::string& name, const std::string& value);
EnvVar MakeFieldRefEnvVar(const std::string& name, const std::string& fieldPath);
EnvVar MakeSecretKeyRefEnvVar(const std::string& name, const std::string& secretName, const std::string& key, bool optional);

bool EnvVarFromJson(const Json::Value& json, EnvVar& env, std::string& errorMsg);
bool EnvVarsFromJson(const Json::Value& json, std::vector<EnvVar>& envs, std::string& errorMsg);
bool ContainerFromJson(const Json::Value& json, Container& container, std::string& errorMsg);
bool ObjectMetaFromJson(const Json::Value& json, ObjectMeta& meta, std::string& errorMsg);
bool PodFromJson(const Json::Value& json, Pod& pod, std::string& errorMsg);
bool NamespaceFromJson(const Json::Value& json, Namespace& ns, std::string& errorMsg);
bool ReplicaSetFromJson(const Json::Value& json, ReplicaSet& rs, std::string& errorMsg);

Json::Value EnvVarToJson(const EnvVar& env);
Json::Value EnvVarsToJson(const std::vector<EnvVar>& envs);
Json::Value ContainerToJson(const Container& container);
Json::Value ObjectMetaToJson(const ObjectMeta& meta);
Json::Value PodToJson(const Pod& pod);

} // namespace k8sagent
