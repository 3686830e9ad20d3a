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

#include "common/http/HttpResponse.h"

using namespace std;

namespace k8sagent {

size_t DefaultWriteCallback(char* buffer, size_t size, size_t nmemb, void* data) {
    size_t sizes = size * nmemb;
    if (buffer == NULL) {
        return 0;
    }
    static_cast<string*>(data)->append(buffer, sizes);
    return sizes;
}

void HttpResponse::SetNetworkStatus(CURLcode code) {
    mNetworkStatus.mMessage = curl_easy_strerror(code);
    // please refer to https://curl.se/libcurl/c/libcurl-errors.html
    switch (code) {
        case CURLE_OK:
            mNetworkStatus.mCode = NetworkCode::Ok;
            break;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
            mNetworkStatus.mCode = NetworkCode::ConnectionFailed;
            break;
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            mNetworkStatus.mCode = NetworkCode::RemoteAccessDenied;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            mNetworkStatus.mCode = NetworkCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
            mNetworkStatus.mCode = NetworkCode::SSLConnectError;
            break;
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_PEER_FAILED_VERIFICATION:
            mNetworkStatus.mCode = NetworkCode::SSLCertError;
            break;
        case CURLE_SEND_ERROR:
            mNetworkStatus.mCode = NetworkCode::SendDataFailed;
            break;
        case CURLE_RECV_ERROR:
            mNetworkStatus.mCode = NetworkCode::RecvDataFailed;
            break;
        default:
            mNetworkStatus.mCode = NetworkCode::Other;
            break;
    }
}

bool HttpResponse::IsTransientFailure() const {
    switch (mNetworkStatus.mCode) {
        case NetworkCode::ConnectionFailed:
        case NetworkCode::Timeout:
        case NetworkCode::SendDataFailed:
        case NetworkCode::RecvDataFailed:
            return true;
        default:
            return false;
    }
}

} // namespace k8sagent
