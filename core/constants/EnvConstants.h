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
#include <string>

namespace k8sagent {

////////////////////////// NEW RELIC AGENT ////////////////////////
extern const std::string ENV_NEW_RELIC_APP_NAME;
extern const std::string ENV_NEW_RELIC_LICENSE_KEY;
extern const std::string ENV_NEW_RELIC_LABELS;
extern const std::string ENV_NEW_RELIC_INSTRUMENTATION_LANGUAGE;

////////////////////////// OTEL SDK ////////////////////////
extern const std::string ENV_OTEL_SERVICE_NAME;
extern const std::string ENV_OTEL_RESOURCE_ATTRIBUTES;
extern const std::string ENV_OTEL_EXPORTER_OTLP_ENDPOINT;
extern const std::string ENV_OTEL_PROPAGATORS;
extern const std::string ENV_OTEL_TRACES_SAMPLER;
extern const std::string ENV_OTEL_TRACES_SAMPLER_ARG;

// Downward API helpers referenced from OTEL_RESOURCE_ATTRIBUTES as $(NAME).
extern const std::string ENV_POD_NAME;
extern const std::string ENV_POD_UID;
extern const std::string ENV_NODE_NAME;

extern const std::string FIELD_PATH_POD_NAME;
extern const std::string FIELD_PATH_POD_UID;
extern const std::string FIELD_PATH_NODE_NAME;

////////////////////////// VALIDATION ////////////////////////
extern const std::string ENV_NEW_RELIC_PREFIX;
extern const std::string ENV_OTEL_PREFIX;

////////////////////////// ANNOTATIONS & LABELS ////////////////////////
extern const std::string ANNOTATION_DEFAULT_IMAGE_PREFIX;
extern const std::string ANNOTATION_DEFAULT_IMAGE_SUFFIX;
extern const std::string LABEL_MANAGED_BY;
extern const std::string LABEL_MANAGED_BY_VALUE;

extern const std::string ANNOTATION_INJECT_GO_CONTAINER_NAMES;

////////////////////////// DEFAULTS ////////////////////////
extern const std::string DEFAULT_LICENSE_SECRET_NAME;
extern const std::string DEFAULT_LICENSE_SECRET_KEY;
extern const std::string DEFAULT_NEW_RELIC_LABELS;

extern const std::string GO_AGENT_SIDECAR_NAME;

} // namespace k8sagent
