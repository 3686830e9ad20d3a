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

#include "instrumentation/InstrumentationWebhook.h"

#include "common/StringTools.h"
#include "constants/EnvConstants.h"
#include "logger/Logger.h"

using namespace std;

namespace k8sagent {

void InstrumentationWebhook::Default(Instrumentation& instrumentation) const {
    LOG_INFO(sLogger, ("default instrumentation", instrumentation.metadata.name));
    auto& labels = instrumentation.metadata.labels;
    if (labels[LABEL_MANAGED_BY].empty()) {
        labels[LABEL_MANAGED_BY] = LABEL_MANAGED_BY_VALUE;
    }

    const auto& annotations = instrumentation.metadata.annotations;
    for (Language language : AllLanguages()) {
        LanguageSpec& spec = instrumentation.spec.MutableLanguageSpec(language);
        if (!spec.image.empty()) {
            continue;
        }
        auto it = annotations.find(ANNOTATION_DEFAULT_IMAGE_PREFIX + LanguageName(language)
                                   + ANNOTATION_DEFAULT_IMAGE_SUFFIX);
        if (it != annotations.end()) {
            spec.image = it->second;
        }
    }
}

bool InstrumentationWebhook::ValidateCreate(const Instrumentation& instrumentation, string& errorMsg) const {
    LOG_INFO(sLogger, ("validate create", instrumentation.metadata.name));
    return Validate(instrumentation, errorMsg);
}

bool InstrumentationWebhook::ValidateUpdate(const Instrumentation& instrumentation,
                                            const Instrumentation& old,
                                            string& errorMsg) const {
    LOG_INFO(sLogger, ("validate update", instrumentation.metadata.name)("previous", old.metadata.name));
    return Validate(instrumentation, errorMsg);
}

bool InstrumentationWebhook::ValidateDelete(const Instrumentation& instrumentation, string& errorMsg) const {
    LOG_INFO(sLogger, ("validate delete", instrumentation.metadata.name));
    errorMsg.clear();
    return true;
}

bool InstrumentationWebhook::Validate(const Instrumentation& instrumentation, string& errorMsg) const {
    if (!ValidateEnv(instrumentation.spec.env, errorMsg)) {
        return false;
    }
    for (Language language : AllLanguages()) {
        if (!ValidateEnv(instrumentation.spec.GetLanguageSpec(language).env, errorMsg)) {
            return false;
        }
    }
    return true;
}

bool InstrumentationWebhook::ValidateEnv(const vector<EnvVar>& envs, string& errorMsg) const {
    for (const auto& env : envs) {
        if (!StartWith(env.name, ENV_NEW_RELIC_PREFIX) && !StartWith(env.name, ENV_OTEL_PREFIX)) {
            errorMsg = "env name should start with \"" + ENV_NEW_RELIC_PREFIX + "\" or \"" + ENV_OTEL_PREFIX
                + "\": " + env.name;
            return false;
        }
    }
    return true;
}

} // namespace k8sagent
