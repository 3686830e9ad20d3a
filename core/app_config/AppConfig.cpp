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

#include "app_config/AppConfig.h"

#include <cstdlib>
#include <map>

#include <boost/filesystem.hpp>

#include "common/JsonUtil.h"
#include "common/StringTools.h"
#include "logger/Logger.h"

extern char** environ;

using namespace std;

DEFINE_FLAG_INT32(owner_lookup_initial_delay_ms, "first delay between two replicaset lookups, ms", 10);
DEFINE_FLAG_DOUBLE(owner_lookup_backoff_factor, "growth factor of the replicaset lookup delay", 1.5);
DEFINE_FLAG_DOUBLE(owner_lookup_backoff_jitter, "relative jitter of the replicaset lookup delay", 0.1);
DEFINE_FLAG_INT32(owner_lookup_max_attempts, "max replicaset lookups while it is not found", 20);
DEFINE_FLAG_INT32(owner_lookup_max_delay_ms, "max delay between two replicaset lookups, ms", 2000);
DEFINE_FLAG_INT32(owner_resolve_max_depth, "max owner reference levels walked", 5);
DEFINE_FLAG_STRING(license_secret_name, "secret holding the license key", "newrelic-key-secret");
DEFINE_FLAG_STRING(license_secret_key, "key of the license key in the secret", "new_relic_license_key");
DEFINE_FLAG_STRING(new_relic_labels, "value of NEW_RELIC_LABELS", "operator:auto-injection");
DEFINE_FLAG_STRING(go_container_names_annotation,
                   "annotation naming the container instrumented by the go agent",
                   "instrumentation.newrelic.com/go-container-names");

namespace k8sagent {

const string ENV_CONFIG_PREFIX = "K8SAGENT_";

bool AppConfig::LoadAppConfig(const string& configFile) {
    mConfigFile = configFile;
    bool success = true;
    boost::system::error_code ec;
    if (!configFile.empty() && boost::filesystem::exists(configFile, ec)) {
        Json::Value confJson;
        string errorMsg;
        if (LoadJsonFile(configFile, confJson, errorMsg) && confJson.isObject()) {
            ParseJsonToFlags(confJson);
            LOG_INFO(sLogger, ("load config file", configFile));
        } else {
            LOG_ERROR(sLogger,
                      ("failed to load config file", configFile)("error", errorMsg.empty() ? "not an object" : errorMsg));
            success = false;
        }
    } else {
        LOG_INFO(sLogger, ("config file not found, use default config", configFile));
    }
    ParseEnvToFlags();
    return success;
}

InjectorOptions AppConfig::GetInjectorOptions() const {
    InjectorOptions options;
    BackoffPolicy& backoff = options.ownerLookupBackoff;
    backoff.initialDelay = chrono::milliseconds(max(0, INT32_FLAG(owner_lookup_initial_delay_ms)));
    backoff.maxDelay = chrono::milliseconds(max(0, INT32_FLAG(owner_lookup_max_delay_ms)));
    if (DOUBLE_FLAG(owner_lookup_backoff_factor) >= 1.0) {
        backoff.factor = DOUBLE_FLAG(owner_lookup_backoff_factor);
    } else {
        LOG_WARNING(sLogger,
                    ("invalid owner_lookup_backoff_factor", DOUBLE_FLAG(owner_lookup_backoff_factor))("use", backoff.factor));
    }
    if (DOUBLE_FLAG(owner_lookup_backoff_jitter) >= 0.0 && DOUBLE_FLAG(owner_lookup_backoff_jitter) <= 1.0) {
        backoff.jitter = DOUBLE_FLAG(owner_lookup_backoff_jitter);
    } else {
        LOG_WARNING(sLogger,
                    ("invalid owner_lookup_backoff_jitter", DOUBLE_FLAG(owner_lookup_backoff_jitter))("use", backoff.jitter));
    }
    backoff.maxAttempts = static_cast<uint32_t>(max(1, INT32_FLAG(owner_lookup_max_attempts)));
    options.ownerResolveMaxDepth = static_cast<uint32_t>(max(1, INT32_FLAG(owner_resolve_max_depth)));
    options.licenseSecretName = STRING_FLAG(license_secret_name);
    options.licenseSecretKey = STRING_FLAG(license_secret_key);
    options.labels = STRING_FLAG(new_relic_labels);
    options.goContainerNamesAnnotation = STRING_FLAG(go_container_names_annotation);
    return options;
}

void AppConfig::SetConfigFlag(const string& flagName, const string& value) {
    GFLAGS_NAMESPACE::CommandLineFlagInfo info;
    bool rst = GFLAGS_NAMESPACE::GetCommandLineFlagInfo(flagName.c_str(), &info);
    if (rst) {
        string beforeValue = info.current_value;
        string setrst = GFLAGS_NAMESPACE::SetCommandLineOption(flagName.c_str(), value.c_str());
        GFLAGS_NAMESPACE::GetCommandLineFlagInfo(flagName.c_str(), &info);
        LOG_INFO(sLogger,
                 ("set config flag", flagName)("before value", beforeValue)("after value", info.current_value)(
                     "result", setrst.empty() ? ("error with value " + value) : setrst));
    } else {
        LOG_DEBUG(sLogger, ("flag not defined", flagName));
    }
}

void AppConfig::ParseEnvToFlags() {
    if (environ == NULL) {
        return;
    }
    map<string, string> envMapping;
    for (size_t i = 0; environ[i] != NULL; i++) {
        string envStr = environ[i];
        size_t pos = envStr.find('=');
        if (pos == string::npos || !StartWith(envStr, ENV_CONFIG_PREFIX)) {
            continue;
        }
        string key = ToLowerCaseString(envStr.substr(ENV_CONFIG_PREFIX.size(), pos - ENV_CONFIG_PREFIX.size()));
        if (key.empty()) {
            continue;
        }
        envMapping[key] = envStr.substr(pos + 1);
    }
    for (const auto& iter : envMapping) {
        SetConfigFlag(iter.first, iter.second);
    }
}

void AppConfig::ParseJsonToFlags(const Json::Value& confJson) {
    RecurseParseJsonToFlags(confJson, "");
}

void AppConfig::RecurseParseJsonToFlags(const Json::Value& confJson, const string& prefix) {
    for (const auto& name : confJson.getMemberNames()) {
        const Json::Value& jsonvalue = confJson[name];
        string fullName = prefix.empty() ? name : prefix + "_" + name;
        if (jsonvalue.isObject()) {
            RecurseParseJsonToFlags(jsonvalue, fullName);
        } else if (jsonvalue.isConvertibleTo(Json::stringValue)) {
            SetConfigFlag(fullName, jsonvalue.asString());
        } else {
            LOG_INFO(sLogger,
                     ("set config flag failed", "can not convert json value to flag")("flag name", fullName)(
                         "jsonvalue", JsonToString(jsonvalue)));
        }
    }
}

} // namespace k8sagent
