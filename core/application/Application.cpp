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

#include "application/Application.h"

#include <fstream>
#include <iostream>

#include "app_config/AppConfig.h"
#include "common/JsonUtil.h"
#include "common/RuntimeUtil.h"
#include "instrumentation/InstrumentationWebhook.h"
#include "instrumentation/SdkInjector.h"
#include "logger/Logger.h"
#include "metadata/KubeApiObjectLookup.h"

using namespace std;

DEFINE_FLAG_STRING(request_file, "injection request, json", "");
DEFINE_FLAG_STRING(output_file, "where the injected pod is written, stdout if empty", "");
DEFINE_FLAG_STRING(config_file, "injector config file, relative to the binary if not absolute", "k8sagent_config.json");
DEFINE_FLAG_BOOL(use_kube_api, "look up replicasets in the kube-apiserver instead of the request", false);

namespace k8sagent {

bool Application::Init() {
    string configFile = STRING_FLAG(config_file);
    if (!configFile.empty() && configFile[0] != '/') {
        configFile = AbsolutePathFromExecutionDir(configFile);
    }
    return AppConfig::GetInstance()->LoadAppConfig(configFile);
}

int Application::Run() {
    if (STRING_FLAG(request_file).empty()) {
        LOG_ERROR(sLogger, ("no request file", "set --request_file"));
        cerr << "no request file, set --request_file" << endl;
        return 1;
    }
    Json::Value root;
    string errorMsg;
    if (!LoadJsonFile(STRING_FLAG(request_file), root, errorMsg)) {
        LOG_ERROR(sLogger, ("failed to load request", STRING_FLAG(request_file))("error", errorMsg));
        cerr << "failed to load request " << STRING_FLAG(request_file) << ": " << errorMsg << endl;
        return 1;
    }
    InjectionRequest request;
    if (!InjectionRequestFromJson(root, request, errorMsg)) {
        LOG_ERROR(sLogger, ("invalid request", STRING_FLAG(request_file))("error", errorMsg));
        cerr << "invalid request " << STRING_FLAG(request_file) << ": " << errorMsg << endl;
        return 1;
    }

    Pod pod = Process(request);
    if (!WriteOutput(JsonToString(PodToJson(pod), true), errorMsg)) {
        LOG_ERROR(sLogger, ("failed to write injected pod", STRING_FLAG(output_file))("error", errorMsg));
        cerr << errorMsg << endl;
        return 1;
    }
    return 0;
}

Pod Application::Process(InjectionRequest& request) const {
    PrepareInstrumentations(request.instrumentations);
    unique_ptr<K8sObjectLookup> lookup = CreateObjectLookup(request);
    SdkInjector injector(lookup.get(), AppConfig::GetInstance()->GetInjectorOptions());
    return injector.Inject(request.instrumentations, request.k8sNamespace, request.pod, request.containerName);
}

void Application::PrepareInstrumentations(LanguageInstrumentations& instrumentations) const {
    InstrumentationWebhook webhook;
    for (auto& item : instrumentations) {
        if (!item.second) {
            continue;
        }
        webhook.Default(*item.second);
        string errorMsg;
        if (!webhook.ValidateCreate(*item.second, errorMsg)) {
            LOG_ERROR(sLogger,
                      ("skip invalid instrumentation", item.second->metadata.name)("language", LanguageName(item.first))(
                          "error", errorMsg));
            item.second.reset();
        }
    }
}

unique_ptr<K8sObjectLookup> Application::CreateObjectLookup(const InjectionRequest& request) const {
    if (BOOL_FLAG(use_kube_api)) {
        auto lookup = make_unique<KubeApiObjectLookup>();
        LOG_INFO(sLogger, ("look up replicasets in kube-apiserver", lookup->GetHost())("port", lookup->GetPort()));
        return lookup;
    }
    auto lookup = make_unique<StaticObjectLookup>();
    for (const auto& replicaSet : request.replicaSets) {
        lookup->AddReplicaSet(replicaSet);
    }
    return lookup;
}

bool Application::WriteOutput(const string& content, string& errorMsg) const {
    if (STRING_FLAG(output_file).empty()) {
        cout << content << endl;
        return true;
    }
    ofstream out(STRING_FLAG(output_file), ios::trunc);
    if (!out) {
        errorMsg = "failed to open output file " + STRING_FLAG(output_file);
        return false;
    }
    out << content << endl;
    if (!out) {
        errorMsg = "failed to write output file " + STRING_FLAG(output_file);
        return false;
    }
    return true;
}

} // namespace k8sagent
