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

#include <memory>
#include <string>

#include "application/InjectionRequest.h"
#include "common/Flags.h"
#include "metadata/K8sObjectLookup.h"

DECLARE_FLAG_STRING(request_file);
DECLARE_FLAG_STRING(output_file);
DECLARE_FLAG_STRING(config_file);
DECLARE_FLAG_BOOL(use_kube_api);

namespace k8sagent {

class Application {
public:
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    static Application* GetInstance() {
        static Application instance;
        return &instance;
    }

    // Loads the configuration, false when the config file is malformed.
    bool Init();
    // Injects the request named by --request_file. @return process exit code.
    int Run();

    // Defaults and validates the instrumentations of @request, then injects them.
    Pod Process(InjectionRequest& request) const;

private:
    Application() = default;
    ~Application() = default;

    void PrepareInstrumentations(LanguageInstrumentations& instrumentations) const;
    std::unique_ptr<K8sObjectLookup> CreateObjectLookup(const InjectionRequest& request) const;
    bool WriteOutput(const std::string& content, std::string& errorMsg) const;
};

} // namespace k8sagent
