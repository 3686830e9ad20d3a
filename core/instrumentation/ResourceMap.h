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
#include <set>
#include <string>

#include "constants/ResourceAttributeKeys.h"

namespace k8sagent {

// Resource attributes to be appended to OTEL_RESOURCE_ATTRIBUTES. Keys are kept
// sorted so that serializing an unchanged map always yields the same string.
class ResourceMap {
public:
    bool Contains(const std::string& key) const { return mAttributes.find(key) != mAttributes.end(); }
    bool Contains(ResourceAttributeKey key) const { return Contains(ResourceAttributeName(key)); }

    // Empty string if the key is not set.
    const std::string& Get(const std::string& key) const;
    const std::string& Get(ResourceAttributeKey key) const { return Get(ResourceAttributeName(key)); }

    void Set(const std::string& key, const std::string& value) { mAttributes[key] = value; }
    void Set(ResourceAttributeKey key, const std::string& value) { Set(ResourceAttributeName(key), value); }
    void Erase(const std::string& key) { mAttributes.erase(key); }

    bool Empty() const { return mAttributes.empty(); }
    size_t Size() const { return mAttributes.size(); }
    const std::map<std::string, std::string>& GetAttributes() const { return mAttributes; }

private:
    std::map<std::string, std::string> mAttributes;
};

// "k1=v1,k2=v2" in lexicographic key order.
std::string ResourceMapToStr(const ResourceMap& resources);

// Keys already declared in an OTEL_RESOURCE_ATTRIBUTES value. Pairs that do not
// split into exactly one key and one value are ignored.
std::set<std::string> ParseDeclaredResourceKeys(const std::string& value);

// namespace.pod.container, or empty if any part is missing.
std::string CreateServiceInstanceId(const std::string& namespaceName,
                                    const std::string& podName,
                                    const std::string& containerName);

} // namespace k8sagent
