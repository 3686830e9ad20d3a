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
#include <json/json.h>

#include <string>

#include "common/Flags.h"
#include "instrumentation/InjectorOptions.h"

DECLARE_FLAG_INT32(owner_lookup_initial_delay_ms);
DECLARE_FLAG_DOUBLE(owner_lookup_backoff_factor);
DECLARE_FLAG_DOUBLE(owner_lookup_backoff_jitter);
DECLARE_FLAG_INT32(owner_lookup_max_attempts);
DECLARE_FLAG_INT32(owner_lookup_max_delay_ms);
DECLARE_FLAG_INT32(owner_resolve_max_depth);
DECLARE_FLAG_STRING(license_secret_name);
DECLARE_FLAG_STRING(license_secret_key);
DECLARE_FLAG_STRING(new_relic_labels);
DECLARE_FLAG_STRING(go_container_names_annotation);

namespace k8sagent {

extern const std::string ENV_CONFIG_PREFIX;

// Process wide configuration. Every setting is a gflag: the optional JSON config
// file is applied first (nested objects give flag names joined with '_'), then
// K8SAGENT_<FLAG> environment variables, so the environment wins.
class AppConfig {
public:
    static AppConfig* GetInstance() {
        static AppConfig* ptr = new AppConfig();
        return ptr;
    }

    // A missing @configFile is not an error, an unreadable or malformed one is.
    bool LoadAppConfig(const std::string& configFile);

    // Snapshot of the injector settings, sanitized.
    InjectorOptions GetInjectorOptions() const;

    const std::string& GetConfigFile() const { return mConfigFile; }

    static void SetConfigFlag(const std::string& flagName, const std::string& value);

private:
    AppConfig() = default;
    ~AppConfig() = default;

    void ParseJsonToFlags(const Json::Value& confJson);
    void RecurseParseJsonToFlags(const Json::Value& confJson, const std::string& prefix);
    void ParseEnvToFlags();

    std::string mConfigFile;

#ifdef K8SAGENT_UNIT_TEST_MAIN
    friend class AppConfigUnittest;
#endif
};

} // namespace k8sagent
