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

#include <fstream>

#include "app_config/AppConfig.h"
#include "unittest/Unittest.h"

using namespace std;

namespace k8sagent {

class AppConfigUnittest : public ::testing::Test {
public:
    void TestLoadConfigFile();
    void TestEnvOverridesFile();
    void TestMissingConfigFile();
    void TestMalformedConfigFile();
    void TestInjectorOptions();
    void TestInjectorOptionsSanitized();

protected:
    void TearDown() override {
        UnsetEnv("K8SAGENT_OWNER_LOOKUP_MAX_ATTEMPTS");
        UnsetEnv("K8SAGENT_NEW_RELIC_LABELS");
        INT32_FLAG(owner_lookup_initial_delay_ms) = 10;
        DOUBLE_FLAG(owner_lookup_backoff_factor) = 1.5;
        DOUBLE_FLAG(owner_lookup_backoff_jitter) = 0.1;
        INT32_FLAG(owner_lookup_max_attempts) = 20;
        INT32_FLAG(owner_lookup_max_delay_ms) = 2000;
        INT32_FLAG(owner_resolve_max_depth) = 5;
        STRING_FLAG(license_secret_name) = "newrelic-key-secret";
        STRING_FLAG(license_secret_key) = "new_relic_license_key";
        STRING_FLAG(new_relic_labels) = "operator:auto-injection";
    }

    void WriteConfig(const string& content) { ofstream(mConfigFile) << content; }

    TemporaryDirectory mTmpDir{"k8sagent_app_config"};
    string mConfigFile = mTmpDir.File("k8sagent_config.json");
};

void AppConfigUnittest::TestLoadConfigFile() {
    WriteConfig(R"({
        "owner_lookup": {"max_attempts": 7, "initial_delay_ms": 50, "backoff": {"factor": 2}},
        "owner_resolve_max_depth": "3",
        "license_secret_name": "nr-license",
        "not_a_flag": true,
        "new_relic_labels": ["a", "b"]
    })");
    AppConfig* config = AppConfig::GetInstance();
    K8SAGENT_TEST_TRUE(config->LoadAppConfig(mConfigFile));
    K8SAGENT_TEST_EQUAL(mConfigFile, config->GetConfigFile());

    K8SAGENT_TEST_EQUAL(7, INT32_FLAG(owner_lookup_max_attempts));
    K8SAGENT_TEST_EQUAL(50, INT32_FLAG(owner_lookup_initial_delay_ms));
    K8SAGENT_TEST_EQUAL(2.0, DOUBLE_FLAG(owner_lookup_backoff_factor));
    K8SAGENT_TEST_EQUAL(3, INT32_FLAG(owner_resolve_max_depth));
    K8SAGENT_TEST_EQUAL("nr-license", STRING_FLAG(license_secret_name));
    // Arrays do not map to a flag.
    K8SAGENT_TEST_EQUAL("operator:auto-injection", STRING_FLAG(new_relic_labels));
}

void AppConfigUnittest::TestEnvOverridesFile() {
    WriteConfig(R"({"owner_lookup_max_attempts": 7, "new_relic_labels": "team:payments"})");
    SetEnv("K8SAGENT_OWNER_LOOKUP_MAX_ATTEMPTS", "3");

    K8SAGENT_TEST_TRUE(AppConfig::GetInstance()->LoadAppConfig(mConfigFile));
    K8SAGENT_TEST_EQUAL(3, INT32_FLAG(owner_lookup_max_attempts));
    K8SAGENT_TEST_EQUAL("team:payments", STRING_FLAG(new_relic_labels));

    SetEnv("K8SAGENT_NEW_RELIC_LABELS", "team:search");
    SetEnv("K8SAGENT_OWNER_LOOKUP_MAX_ATTEMPTS", "many");
    K8SAGENT_TEST_TRUE(AppConfig::GetInstance()->LoadAppConfig(mConfigFile));
    K8SAGENT_TEST_EQUAL("team:search", STRING_FLAG(new_relic_labels));
    // An unparsable value leaves the flag as the file set it.
    K8SAGENT_TEST_EQUAL(7, INT32_FLAG(owner_lookup_max_attempts));
}

void AppConfigUnittest::TestMissingConfigFile() {
    SetEnv("K8SAGENT_OWNER_LOOKUP_MAX_ATTEMPTS", "4");
    K8SAGENT_TEST_TRUE(AppConfig::GetInstance()->LoadAppConfig(mTmpDir.File("absent.json")));
    K8SAGENT_TEST_EQUAL(4, INT32_FLAG(owner_lookup_max_attempts));
    K8SAGENT_TEST_TRUE(AppConfig::GetInstance()->LoadAppConfig(""));
}

void AppConfigUnittest::TestMalformedConfigFile() {
    WriteConfig("{\"owner_lookup_max_attempts\": ");
    SetEnv("K8SAGENT_OWNER_LOOKUP_MAX_ATTEMPTS", "4");
    K8SAGENT_TEST_FALSE(AppConfig::GetInstance()->LoadAppConfig(mConfigFile));
    // The environment is still applied.
    K8SAGENT_TEST_EQUAL(4, INT32_FLAG(owner_lookup_max_attempts));

    WriteConfig("[1, 2]");
    K8SAGENT_TEST_FALSE(AppConfig::GetInstance()->LoadAppConfig(mConfigFile));
}

void AppConfigUnittest::TestInjectorOptions() {
    InjectorOptions options = AppConfig::GetInstance()->GetInjectorOptions();
    K8SAGENT_TEST_EQUAL(10, options.ownerLookupBackoff.initialDelay.count());
    K8SAGENT_TEST_EQUAL(1.5, options.ownerLookupBackoff.factor);
    K8SAGENT_TEST_EQUAL(0.1, options.ownerLookupBackoff.jitter);
    K8SAGENT_TEST_EQUAL(20U, options.ownerLookupBackoff.maxAttempts);
    K8SAGENT_TEST_EQUAL(2000, options.ownerLookupBackoff.maxDelay.count());
    K8SAGENT_TEST_EQUAL(5U, options.ownerResolveMaxDepth);
    K8SAGENT_TEST_EQUAL("newrelic-key-secret", options.licenseSecretName);
    K8SAGENT_TEST_EQUAL("new_relic_license_key", options.licenseSecretKey);
    K8SAGENT_TEST_EQUAL("operator:auto-injection", options.labels);
    K8SAGENT_TEST_EQUAL("instrumentation.newrelic.com/go-container-names", options.goContainerNamesAnnotation);

    STRING_FLAG(license_secret_name) = "nr-license";
    INT32_FLAG(owner_lookup_max_attempts) = 3;
    options = AppConfig::GetInstance()->GetInjectorOptions();
    K8SAGENT_TEST_EQUAL("nr-license", options.licenseSecretName);
    K8SAGENT_TEST_EQUAL(3U, options.ownerLookupBackoff.maxAttempts);
}

void AppConfigUnittest::TestInjectorOptionsSanitized() {
    INT32_FLAG(owner_lookup_initial_delay_ms) = -5;
    INT32_FLAG(owner_lookup_max_delay_ms) = -1;
    DOUBLE_FLAG(owner_lookup_backoff_factor) = 0.5;
    DOUBLE_FLAG(owner_lookup_backoff_jitter) = 1.5;
    INT32_FLAG(owner_lookup_max_attempts) = 0;
    INT32_FLAG(owner_resolve_max_depth) = -2;

    InjectorOptions options = AppConfig::GetInstance()->GetInjectorOptions();
    K8SAGENT_TEST_EQUAL(0, options.ownerLookupBackoff.initialDelay.count());
    K8SAGENT_TEST_EQUAL(0, options.ownerLookupBackoff.maxDelay.count());
    K8SAGENT_TEST_EQUAL(1.5, options.ownerLookupBackoff.factor);
    K8SAGENT_TEST_EQUAL(0.1, options.ownerLookupBackoff.jitter);
    K8SAGENT_TEST_EQUAL(1U, options.ownerLookupBackoff.maxAttempts);
    K8SAGENT_TEST_EQUAL(1U, options.ownerResolveMaxDepth);
}

UNIT_TEST_CASE(AppConfigUnittest, TestLoadConfigFile)
UNIT_TEST_CASE(AppConfigUnittest, TestEnvOverridesFile)
UNIT_TEST_CASE(AppConfigUnittest, TestMissingConfigFile)
UNIT_TEST_CASE(AppConfigUnittest, TestMalformedConfigFile)
UNIT_TEST_CASE(AppConfigUnittest, TestInjectorOptions)
UNIT_TEST_CASE(AppConfigUnittest, TestInjectorOptionsSanitized)

} // namespace k8sagent

UNIT_TEST_MAIN
