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

#include <curl/curl.h>

#include "application/Application.h"
#include "common/Flags.h"
#include "logger/Logger.h"

using namespace k8sagent;

int main(int argc, char** argv) {
    gflags::SetUsageMessage("k8sagent_injector --request_file=<json> [--output_file=<json>] [--config_file=<json>] "
                            "[--use_kube_api]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    Logger::Instance().InitGlobalLoggers();
    curl_global_init(CURL_GLOBAL_ALL);

    Application* app = Application::GetInstance();
    int ret = 1;
    if (app->Init()) {
        ret = app->Run();
    } else {
        LOG_ERROR(sLogger, ("failed to init injector", "invalid config file"));
    }
    LOG_INFO(sLogger, ("injector exit", ret));

    curl_global_cleanup();
    gflags::ShutDownCommandLineFlags();
    return ret;
}
