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

#include "metadata/KubeApiObjectLookup.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "common/JsonUtil.h"
#include "common/StringTools.h"
#include "common/http/Curl.h"
#include "logger/Logger.h"

using namespace std;

DEFINE_FLAG_STRING(kube_apiserver_host, "kube-apiserver host, empty means KUBERNETES_SERVICE_HOST", "");
DEFINE_FLAG_INT32(kube_apiserver_port, "kube-apiserver port, 0 means KUBERNETES_SERVICE_PORT", 0);
DEFINE_FLAG_STRING(kube_service_account_token_path,
                   "service account token used against the kube-apiserver",
                   "/var/run/secrets/kubernetes.io/serviceaccount/token");
DEFINE_FLAG_STRING(kube_service_account_ca_path,
                   "CA bundle of the kube-apiserver",
                   "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt");
DEFINE_FLAG_INT32(kube_api_request_timeout_secs, "timeout of one kube-apiserver request, seconds", 5);

namespace k8sagent {

namespace {

const int32_t kDefaultApiServerPort = 443;

string ResolveHost() {
    if (!STRING_FLAG(kube_apiserver_host).empty()) {
        return STRING_FLAG(kube_apiserver_host);
    }
    const char* host = getenv("KUBERNETES_SERVICE_HOST");
    return host == nullptr ? string() : string(host);
}

int32_t ResolvePort() {
    if (INT32_FLAG(kube_apiserver_port) > 0) {
        return INT32_FLAG(kube_apiserver_port);
    }
    const char* port = getenv("KUBERNETES_SERVICE_PORT");
    if (port != nullptr) {
        int32_t value = 0;
        if (StringTo(port, value) && value > 0) {
            return value;
        }
        LOG_WARNING(sLogger, ("invalid KUBERNETES_SERVICE_PORT", port)("use", kDefaultApiServerPort));
    }
    return kDefaultApiServerPort;
}

} // namespace

KubeApiObjectLookup::KubeApiObjectLookup()
    : KubeApiObjectLookup(ResolveHost(),
                          ResolvePort(),
                          STRING_FLAG(kube_service_account_token_path),
                          STRING_FLAG(kube_service_account_ca_path),
                          static_cast<uint32_t>(INT32_FLAG(kube_api_request_timeout_secs))) {
}

KubeApiObjectLookup::KubeApiObjectLookup(
    const string& host, int32_t port, const string& tokenPath, const string& caPath, uint32_t timeoutSecs)
    : mHost(host), mPort(port), mTokenPath(tokenPath), mCaPath(caPath), mTimeoutSecs(timeoutSecs) {
}

string KubeApiObjectLookup::ReplicaSetPath(const string& k8sNamespace, const string& name) {
    return "/apis/apps/v1/namespaces/" + k8sNamespace + "/replicasets/" + name;
}

bool KubeApiObjectLookup::LoadToken(string& token, string& errorMsg) const {
    ifstream in(mTokenPath);
    if (!in) {
        errorMsg = "failed to open service account token: " + mTokenPath;
        return false;
    }
    stringstream buffer;
    buffer << in.rdbuf();
    token = TrimString(buffer.str());
    if (token.empty()) {
        errorMsg = "service account token is empty: " + mTokenPath;
        return false;
    }
    return true;
}

LookupStatus KubeApiObjectLookup::GetReplicaSet(const string& k8sNamespace,
                                                const string& name,
                                                ReplicaSet& replicaSet,
                                                string& errorMsg) {
    if (mHost.empty()) {
        errorMsg = "kube-apiserver host is unknown";
        return LookupStatus::kError;
    }
    string token;
    if (!LoadToken(token, errorMsg)) {
        return LookupStatus::kError;
    }
    HttpRequest request("GET", true, mHost, mPort, ReplicaSetPath(k8sNamespace, name));
    request.mHeader["Authorization"] = "Bearer " + token;
    request.mHeader["Accept"] = "application/json";
    request.mTls.mCaFile = mCaPath;
    request.mTimeout = mTimeoutSecs;

    HttpResponse response;
    if (!SendHttpRequest(request, response)) {
        errorMsg = "failed to reach kube-apiserver: " + response.GetNetworkStatus().mMessage;
        return LookupStatus::kError;
    }
    if (response.GetStatusCode() == 404) {
        errorMsg = "replicasets \"" + name + "\" not found";
        return LookupStatus::kNotFound;
    }
    if (response.GetStatusCode() != 200) {
        errorMsg = "unexpected status " + to_string(response.GetStatusCode()) + " from kube-apiserver: "
            + response.GetBody();
        return LookupStatus::kError;
    }
    Json::Value root;
    if (!ParseJsonTable(response.GetBody(), root, errorMsg)) {
        errorMsg = "invalid replicaset from kube-apiserver: " + errorMsg;
        return LookupStatus::kError;
    }
    if (!ReplicaSetFromJson(root, replicaSet, errorMsg)) {
        return LookupStatus::kError;
    }
    LOG_DEBUG(sLogger, ("got replicaset", name)("namespace", k8sNamespace)("owners", replicaSet.metadata.ownerReferences.size()));
    return LookupStatus::kOk;
}

} // namespace k8sagent
