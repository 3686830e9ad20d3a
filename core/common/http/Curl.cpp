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

#include "common/http/Curl.h"

#include <curl/curl.h>

#include <memory>
#include <string>

#include "logger/Logger.h"

using namespace std;

DEFINE_FLAG_INT32(default_http_request_timeout_secs, "timeout of one http request, seconds", 10);
DEFINE_FLAG_INT32(default_http_request_max_try_cnt, "max tries of one http request on transport errors", 3);

namespace k8sagent {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlPtr = unique_ptr<CURL, CurlDeleter>;
using CurlSlistPtr = unique_ptr<curl_slist, CurlSlistDeleter>;

CurlPtr CreateCurlHandler(const HttpRequest& request, HttpResponse& response, CurlSlistPtr& headers) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return curl;
    }

    string totalUrl = request.mHTTPSFlag ? "https://" : "http://";
    totalUrl.append(request.mHost).append(request.mUrl);
    curl_easy_setopt(curl.get(), CURLOPT_URL, totalUrl.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PORT, static_cast<long>(request.mPort));
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.mMethod.c_str());

    curl_slist* list = nullptr;
    for (const auto& iter : request.mHeader) {
        list = curl_slist_append(list, (iter.first + ": " + iter.second).c_str());
    }
    headers.reset(list);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.mHTTPSFlag) {
        if (!request.mTls.mCaFile.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_CAINFO, request.mTls.mCaFile.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, request.mTls.mInsecureSkipVerify ? 0L : 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, request.mTls.mInsecureSkipVerify ? 0L : 2L);
    }

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.mTimeout));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.GetBody());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, DefaultWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NETRC, static_cast<long>(CURL_NETRC_IGNORED));
    return curl;
}

} // namespace

bool SendHttpRequest(HttpRequest& request, HttpResponse& response) {
    CurlSlistPtr headers;
    CurlPtr curl = CreateCurlHandler(request, response, headers);
    if (!curl) {
        LOG_ERROR(sLogger, ("failed to init curl handler", request.mHost));
        return false;
    }
    while (true) {
        CURLcode res = curl_easy_perform(curl.get());
        response.SetNetworkStatus(res);
        if (res == CURLE_OK) {
            long httpCode = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
            response.SetStatusCode(static_cast<int32_t>(httpCode));
            return true;
        }
        if (!response.IsTransientFailure() || request.mTryCnt >= request.mMaxTryCnt) {
            LOG_WARNING(sLogger,
                        ("failed to send http request", curl_easy_strerror(res))("host", request.mHost)(
                            "url", request.mUrl)("try cnt", request.mTryCnt));
            return false;
        }
        LOG_DEBUG(sLogger,
                  ("failed to send http request", "retry immediately")("host", request.mHost)("url", request.mUrl)(
                      "try cnt", request.mTryCnt)("errMsg", curl_easy_strerror(res)));
        ++request.mTryCnt;
        response.GetBody().clear();
    }
}

} // namespace k8sagent
