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

#include <curl/curl.h>

#include <cstdint>
#include <string>

namespace k8sagent {

enum class NetworkCode {
    Ok = 0,
    ConnectionFailed,
    RemoteAccessDenied,
    SSLConnectError,
    SSLCertError,
    SendDataFailed,
    RecvDataFailed,
    Timeout,
    Other
};

struct NetWorkStatus {
    NetworkCode mCode = NetworkCode::Ok;
    std::string mMessage;
};

size_t DefaultWriteCallback(char* buffer, size_t size, size_t nmemb, void* data);

class HttpResponse {
public:
    int32_t GetStatusCode() const { return mStatusCode; }
    void SetStatusCode(int32_t code) { mStatusCode = code; }

    const std::string& GetBody() const { return mBody; }
    std::string& GetBody() { return mBody; }

    void SetNetworkStatus(CURLcode code);
    const NetWorkStatus& GetNetworkStatus() const { return mNetworkStatus; }
    // Whether sending the same request again may succeed.
    bool IsTransientFailure() const;

private:
    int32_t mStatusCode = 0; // 0 means no response from server
    NetWorkStatus mNetworkStatus;
    std::string mBody;
};

} // namespace k8sagent
