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

#include "common/http/HttpRequest.h"
#include "common/http/HttpResponse.h"

namespace k8sagent {

// Blocking send. Transient transport failures are retried right away up to
// request.mMaxTryCnt tries. Any HTTP status counts as success and is left to the
// caller.
bool SendHttpRequest(HttpRequest& request, HttpResponse& response);

} // namespace k8sagent
