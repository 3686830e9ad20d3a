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
#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "models/K8sObjects.h"

namespace k8sagent {

// Declaration order is the order languages are injected in.
enum class Language { Java, NodeJS, Python, DotNet, Php, Go };

const std::vector<Language>& AllLanguages();
const std::string& LanguageName(Language language);
bool LanguageFromName(const std::string& name, Language& language);

enum class Propagator { TraceContext, Baggage, B3, B3Multi, Jaeger, XRay, OTTrace, None };

const std::string& PropagatorName(Propagator propagator);
bool PropagatorFromName(const std::string& name, Propagator& propagator);

struct LanguageSpec {
    std::string image;
    std::vector<EnvVar> env;
};

struct ExporterSpec {
    std::string endpoint;
};

struct ResourceSpec {
    std::map<std::string, std::string> attributes;
    bool addK8sUIDAttributes = false;
};

struct SamplerSpec {
    std::string type;
    std::string argument;
};

struct InstrumentationSpec {
    ExporterSpec exporter;
    ResourceSpec resource;
    std::vector<Propagator> propagators;
    SamplerSpec sampler;
    // Common env vars, applied to every instrumented container.
    std::vector<EnvVar> env;

    LanguageSpec java;
    LanguageSpec nodeJS;
    LanguageSpec python;
    LanguageSpec dotNet;
    LanguageSpec php;
    LanguageSpec go;

    const LanguageSpec& GetLanguageSpec(Language language) const;
    LanguageSpec& MutableLanguageSpec(Language language);
};

struct Instrumentation {
    ObjectMeta metadata;
    InstrumentationSpec spec;
};

// One optional instrumentation per language, resolved before injection starts.
using LanguageInstrumentations = std::map<Language, std::optional<Instrumentation>>;

bool InstrumentationFromJson(const Json::Value& json, Instrumentation& instrumentation, std::string& errorMsg);

} // namespace k8sagent
