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
#include <string>

namespace k8sagent {

/**
 * @brief GetProcessExecutionDir
 * @return dir path ends with '/', empty if the executable path can not be read.
 */
std::string GetProcessExecutionDir();

// Resolves @path against the execution dir unless it is already absolute.
std::string AbsolutePathFromExecutionDir(const std::string& path);

} // namespace k8sagent
