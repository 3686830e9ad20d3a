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

#include "common/RuntimeUtil.h"

#include <limits.h>
#include <unistd.h>

namespace k8sagent {

std::string GetProcessExecutionDir() {
    char exePath[PATH_MAX + 1] = {0};
    ssize_t len = readlink("/proc/self/exe", exePath, PATH_MAX);
    if (len <= 0) {
        return "";
    }
    std::string fullPath(exePath, len);
    size_t index = fullPath.rfind('/');
    if (index == std::string::npos) {
        return "";
    }
    return fullPath.substr(0, index + 1);
}

std::string AbsolutePathFromExecutionDir(const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return path;
    }
    return GetProcessExecutionDir() + path;
}

} // namespace k8sagent
