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

#include "instrumentation/ResourceMap.h"

#include <vector>

#include "common/StringTools.h"

using namespace std;

namespace k8sagent {

const string& ResourceMap::Get(const string& key) const {
    static const string sEmpty;
    auto it = mAttributes.find(key);
    return it == mAttributes.end() ? sEmpty : it->second;
}

string ResourceMapToStr(const ResourceMap& resources) {
    string str;
    for (const auto& kv : resources.GetAttributes()) {
        if (!str.empty()) {
            str += ",";
        }
        str += kv.first + "=" + kv.second;
    }
    return str;
}

set<string> ParseDeclaredResourceKeys(const string& value) {
    set<string> keys;
    for (const auto& kv : SplitString(value, ",")) {
        auto parts = SplitString(TrimString(kv), "=");
        if (parts.size() != 2) {
            continue;
        }
        keys.insert(parts[0]);
    }
    return keys;
}

string CreateServiceInstanceId(const string& namespaceName, const string& podName, const string& containerName) {
    if (namespaceName.empty() || podName.empty() || containerName.empty()) {
        return "";
    }
    return JoinString({namespaceName, podName, containerName}, ".");
}

} // namespace k8sagent
