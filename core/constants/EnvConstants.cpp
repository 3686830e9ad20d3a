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

#include "constants/EnvConstants.h"

namespace k8sagent {

////////////////////////// NEW RELIC AGENT ////////////////////////
const std::string ENV_NEW_RELIC_APP_NAME = "NEW_RELIC_APP_NAME";
const std::string ENV_NEW_RELIC_LICENSE_KEY = "NEW_RELIC_LICENSE_KEY";
const std::string ENV_NEW_RELIC_LABELS = "NEW_RELIC_LABELS";
const std::string ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE = "NEW_RELIC_INSTRUMENTATION_LANGUAGE";

////////////////////////// OTEL SDK ////////////////////////
const std::string ENV_OTEL_SERVICE_NAME = "OTEL_SERVICE_NAME";
const std::string ENV_OTEL_RESOURCE_ATTRIBUTES = "OTEL_RESOURCE_ATTRIBUTES";
const std::string ENV_OTEL_EXPORTER_OTLP_ENDPOINT = "OTEL_EXPORTER_OTLP_ENDPOINT";
const std::string ENV_OTEL_PROPAGATORS = "OTEL_PROPAGATORS";
const std::string ENV_OTEL_TRACES_SAMPLER = "OTEL_TRACES_SAMPLER";
const std::string ENV_OTEL_TRACES_SAMPLER_ARG = "OTEL_TRACES_SAMPLER_ARG";

const std::string ENV_POD_NAME = "OTEL_RESOURCE_ATTRIBUTES_POD_NAME";
const std::string ENV_POD_UID = "OTEL_RESOURCE_ATTRIBUTES_POD_UID";
const std::string ENV_NODE_NAME = "OTEL_RESOURCE_ATTRIBUTES_NODE_NAME";

const std::string FIELD_PATH_POD_NAME = "metadata.name";
const std::string FIELD_PATH_POD_UID = "metadata.uid";
const std::string FIELD_PATH_NODE_NAME = "spec.nodeName";

////////////////////////// VALIDATION ////////////////////////
const std::string ENV_NEW_RELIC_PREFIX = "NEW_RELIC_";
const std::string ENV_OTEL_PREFIX = "OTEL_";

////////////////////////// ANNOTATIONS & LABELS ////////////////////////
const std::string ANNOTATION_DEFAULT_IMAGE_PREFIX = "instrumentation.newrelic.com/default-auto-instrumentation-";
const std::string ANNOTATION_DEFAULT_IMAGE_SUFFIX = "-image";
const std::string LABEL_MANAGED_BY = "app.kubernetes.io/managed-by";
const std::string LABEL_MANAGED_BY_VALUE = "k8s-agents-operator";

const std::string ANNOTATION_INJECT_GO_CONTAINER_NAMES = "instrumentation.newrelic.com/go-container-names";

////////////////////////// DEFAULTS ////////////////////////
const std::string DEFAULT_LICENSE_SECRET_NAME = "newrelic-key-secret";
const std::string DEFAULT_LICENSE_SECRET_KEY = "new_relic_license_key";
const std::string DEFAULT_NEW_RELIC_LABELS = "operator:auto-injection";

const std::string GO_AGENT_SIDECAR_NAME = "newrelic-go-agent";

} // namespace k8sagent
