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
#include <map>
#include <string>

#include "common/Flags.h"

DECLARE_FLAG_INT32(default_http_request_timeout_secs);
DECLARE_FLAG_INT32(default_http_request_max_try_cnt);

namespace k8sagent {

struct CurlTLS {
    // Empty means the system CA bundle.
    std::string mCaFile;
    bool mInsecureSkipVerify = false;
};

struct HttpRequest {
    std::string mMethod;
    bool mHTTPSFlag = true;
    std::string mHost;
    int32_t mPort = 443;
    // Path, with the query string if any.
    std::string mUrl;
    std::map<std::string, std::string> mHeader;
    CurlTLS mTls;

    uint32_t mTimeout = static_cast<uint32_t>(INT32_FLAG(default_http_request_timeout_secs));
    uint32_t mMaxTryCnt = static_cast<uint32_t>(INT32_FLAG(default_http_request_max_try_cnt));
    uint32_t mTryCnt = 1;

    HttpRequest(const std::string& method, bool httpsFlag, const std::string& host, int32_t port, const std::string& url)
        : mMethod(method), mHTTPSFlag(httpsFlag), mHost(host), mPort(port), mUrl(url) {}
};

} // namespace k8sagent
