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
#include <cstdint>
#include <string>

#include "common/Backoff.h"
#include "constants/EnvConstants.h"

namespace k8sagent {

// Settings of one SdkInjector, read-only once the injector is built.
struct InjectorOptions {
    BackoffPolicy ownerLookupBackoff;
    uint32_t ownerResolveMaxDepth = 5;
    std::string licenseSecretName = DEFAULT_LICENSE_SECRET_NAME;
    std::string licenseSecretKey = DEFAULT_LICENSE_SECRET_KEY;
    std::string labels = DEFAULT_NEW_RELIC_LABELS;
    std::string goContainerNamesAnnotation = ANNOTATION_INJECT_GO_CONTAINER_NAMES;
};

} // namespace k8sagent
