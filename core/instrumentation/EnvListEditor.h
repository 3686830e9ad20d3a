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
#include <optional>
#include <string>
#include <vector>

#include "models/K8sObjects.h"

namespace k8sagent {

// The only primitives the injector uses to change a container env list. None of
// them ever replaces an existing entry, which is what makes re-running the
// injection on an already injected pod a no-op.

// Index of the first variable called @name.
std::optional<size_t> GetIndexOfEnv(const std::vector<EnvVar>& envs, const std::string& name);

// Appends @env unless a variable with the same name exists.
// @return true if @env was appended.
bool InsertEnvIfAbsent(std::vector<EnvVar>& envs, const EnvVar& env);

// Removes the variable at @idx and appends it again. Out of range is a no-op.
void MoveEnvToListEnd(std::vector<EnvVar>& envs, std::optional<size_t> idx);

} // namespace k8sagent
