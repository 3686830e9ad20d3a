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

#include "common/Flags.h"
#include "metadata/K8sObjectLookup.h"

DECLARE_FLAG_STRING(kube_apiserver_host);
DECLARE_FLAG_INT32(kube_apiserver_port);
DECLARE_FLAG_STRING(kube_service_account_token_path);
DECLARE_FLAG_STRING(kube_service_account_ca_path);
DECLARE_FLAG_INT32(kube_api_request_timeout_secs);

namespace k8sagent {

// Reads ReplicaSets from the kube-apiserver with the in-cluster service account.
class KubeApiObjectLookup : public K8sObjectLookup {
public:
    // Host and port fall back to KUBERNETES_SERVICE_HOST / KUBERNETES_SERVICE_PORT
    // when the flags are not set.
    KubeApiObjectLookup();
    KubeApiObjectLookup(const std::string& host,
                        int32_t port,
                        const std::string& tokenPath,
                        const std::string& caPath,
                        uint32_t timeoutSecs);

    LookupStatus GetReplicaSet(const std::string& k8sNamespace,
                               const std::string& name,
                               ReplicaSet& replicaSet,
                               std::string& errorMsg) override;

    const std::string& GetHost() const { return mHost; }
    int32_t GetPort() const { return mPort; }

    static std::string ReplicaSetPath(const std::string& k8sNamespace, const std::string& name);

private:
    bool LoadToken(std::string& token, std::string& errorMsg) const;

    std::string mHost;
    int32_t mPort;
    std::string mTokenPath;
    std::string mCaPath;
    uint32_t mTimeoutSecs;
};

} // namespace k8sagent
