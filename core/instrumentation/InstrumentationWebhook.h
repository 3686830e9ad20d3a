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
#include <vector>

#include "instrumentation/Instrumentation.h"

namespace k8sagent {

// Defaulting and validation of Instrumentation resources, run before an
// instrumentation is handed to the SdkInjector.
class InstrumentationWebhook {
public:
    // Fills the managed-by label and, for every language without an image, the
    // image named by the default-auto-instrumentation-<lang>-image annotation.
    void Default(Instrumentation& instrumentation) const;

    bool ValidateCreate(const Instrumentation& instrumentation, std::string& errorMsg) const;
    bool ValidateUpdate(const Instrumentation& instrumentation,
                        const Instrumentation& old,
                        std::string& errorMsg) const;
    bool ValidateDelete(const Instrumentation& instrumentation, std::string& errorMsg) const;

    // Every common and per-language env var name must start with NEW_RELIC_ or OTEL_.
    bool Validate(const Instrumentation& instrumentation, std::string& errorMsg) const;

private:
    bool ValidateEnv(const std::vector<EnvVar>& envs, std::string& errorMsg) const;
};

} // namespace k8sagent
