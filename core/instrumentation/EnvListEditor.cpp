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

#include "instrumentation/EnvListEditor.h"

using namespace std;

namespace k8sagent {

optional<size_t> GetIndexOfEnv(const vector<EnvVar>& envs, const string& name) {
    for (size_t i = 0; i < envs.size(); ++i) {
        if (envs[i].name == name) {
            return i;
        }
    }
    return nullopt;
}

bool InsertEnvIfAbsent(vector<EnvVar>& envs, const EnvVar& env) {
    if (GetIndexOfEnv(envs, env.name)) {
        return false;
    }
    envs.push_back(env);
    return true;
}

void MoveEnvToListEnd(vector<EnvVar>& envs, optional<size_t> idx) {
    if (!idx || *idx >= envs.size()) {
        return;
    }
    EnvVar env = std::move(envs[*idx]);
    envs.erase(envs.begin() + *idx);
    envs.push_back(std::move(env));
}

} // namespace k8sagent
