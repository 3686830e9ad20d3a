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

#include "instrumentation/Instrumentation.h"

#include <utility>

#include "common/JsonUtil.h"
#include "common/StringTools.h"

using namespace std;

namespace k8sagent {

static const vector<pair<Language, string>>& LanguageNames() {
    static const vector<pair<Language, string>> sNames = {
        {Language::Java, "java"},
        {Language::NodeJS, "nodejs"},
        {Language::Python, "python"},
        {Language::DotNet, "dotnet"},
        {Language::Php, "php"},
        {Language::Go, "go"},
    };
    return sNames;
}

static const vector<pair<Propagator, string>>& PropagatorNames() {
    static const vector<pair<Propagator, string>> sNames = {
        {Propagator::TraceContext, "tracecontext"},
        {Propagator::Baggage, "baggage"},
        {Propagator::B3, "b3"},
        {Propagator::B3Multi, "b3multi"},
        {Propagator::Jaeger, "jaeger"},
        {Propagator::XRay, "xray"},
        {Propagator::OTTrace, "ottrace"},
        {Propagator::None, "none"},
    };
    return sNames;
}

const vector<Language>& AllLanguages() {
    static const vector<Language> sLanguages
        = {Language::Java, Language::NodeJS, Language::Python, Language::DotNet, Language::Php, Language::Go};
    return sLanguages;
}

const string& LanguageName(Language language) {
    for (const auto& item : LanguageNames()) {
        if (item.first == language) {
            return item.second;
        }
    }
    static const string sUnknown = "unknown";
    return sUnknown;
}

bool LanguageFromName(const string& name, Language& language) {
    const string lower = ToLowerCaseString(name);
    for (const auto& item : LanguageNames()) {
        if (item.second == lower) {
            language = item.first;
            return true;
        }
    }
    return false;
}

const string& PropagatorName(Propagator propagator) {
    for (const auto& item : PropagatorNames()) {
        if (item.first == propagator) {
            return item.second;
        }
    }
    static const string sUnknown = "none";
    return sUnknown;
}

bool PropagatorFromName(const string& name, Propagator& propagator) {
    for (const auto& item : PropagatorNames()) {
        if (item.second == name) {
            propagator = item.first;
            return true;
        }
    }
    return false;
}

const LanguageSpec& InstrumentationSpec::GetLanguageSpec(Language language) const {
    switch (language) {
        case Language::Java:
            return java;
        case Language::NodeJS:
            return nodeJS;
        case Language::Python:
            return python;
        case Language::DotNet:
            return dotNet;
        case Language::Php:
            return php;
        case Language::Go:
            break;
    }
    return go;
}

LanguageSpec& InstrumentationSpec::MutableLanguageSpec(Language language) {
    return const_cast<LanguageSpec&>(static_cast<const InstrumentationSpec*>(this)->GetLanguageSpec(language));
}

static bool LanguageSpecFromJson(const Json::Value& json, LanguageSpec& spec, string& errorMsg) {
    if (json.isNull()) {
        return true;
    }
    if (!json.isObject()) {
        errorMsg = "language block is not an object";
        return false;
    }
    spec.image = GetStringValue(json, "image");
    return EnvVarsFromJson(json["env"], spec.env, errorMsg);
}

bool InstrumentationFromJson(const Json::Value& json, Instrumentation& instrumentation, string& errorMsg) {
    if (!json.isObject()) {
        errorMsg = "instrumentation is not an object";
        return false;
    }
    if (!ObjectMetaFromJson(json["metadata"], instrumentation.metadata, errorMsg)) {
        return false;
    }
    const Json::Value& spec = json["spec"];
    if (spec.isNull()) {
        return true;
    }
    if (!spec.isObject()) {
        errorMsg = "instrumentation spec is not an object";
        return false;
    }
    InstrumentationSpec& out = instrumentation.spec;
    out.exporter.endpoint = GetStringValue(spec["exporter"], "endpoint");
    if (!GetStringMap(spec["resource"], "resourceAttributes", out.resource.attributes, errorMsg)) {
        return false;
    }
    out.resource.addK8sUIDAttributes = GetBoolValue(spec["resource"], "addK8sUIDAttributes");
    out.sampler.type = GetStringValue(spec["sampler"], "type");
    out.sampler.argument = GetStringValue(spec["sampler"], "argument");

    const Json::Value& propagators = spec["propagators"];
    if (!propagators.isNull()) {
        if (!propagators.isArray()) {
            errorMsg = "propagators is not an array";
            return false;
        }
        for (const auto& item : propagators) {
            Propagator propagator;
            if (!item.isString() || !PropagatorFromName(item.asString(), propagator)) {
                errorMsg = "unknown propagator " + (item.isString() ? item.asString() : JsonToString(item));
                return false;
            }
            out.propagators.push_back(propagator);
        }
    }

    if (!EnvVarsFromJson(spec["env"], out.env, errorMsg)) {
        return false;
    }
    for (Language language : AllLanguages()) {
        if (!LanguageSpecFromJson(spec[LanguageName(language)], out.MutableLanguageSpec(language), errorMsg)) {
            errorMsg = LanguageName(language) + ": " + errorMsg;
            return false;
        }
    }
    return true;
}

} // namespace k8sagent
