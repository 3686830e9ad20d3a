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

#include "common/JsonUtil.h"

#include <fstream>
#include <memory>
#include <sstream>

using namespace std;

namespace k8sagent {

bool ParseJsonTable(const string& content, Json::Value& res, string& errorMsg) {
    Json::CharReaderBuilder builder;
    const unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(content.c_str(), content.c_str() + content.size(), &res, &errorMsg);
}

bool LoadJsonFile(const string& filePath, Json::Value& res, string& errorMsg) {
    ifstream in(filePath);
    if (!in.good()) {
        errorMsg = "failed to open file " + filePath;
        return false;
    }
    stringstream buffer;
    buffer << in.rdbuf();
    string parseError;
    if (!ParseJsonTable(buffer.str(), res, parseError)) {
        errorMsg = "failed to parse json file " + filePath + ": " + parseError;
        return false;
    }
    return true;
}

string JsonToString(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

string GetStringValue(const Json::Value& value, const string& name, const string& defValue) {
    if (!value.isObject() || !value.isMember(name) || !value[name].isString()) {
        return defValue;
    }
    return value[name].asString();
}

bool GetBoolValue(const Json::Value& value, const string& name, bool defValue) {
    if (!value.isObject() || !value.isMember(name) || !value[name].isBool()) {
        return defValue;
    }
    return value[name].asBool();
}

bool GetStringMap(const Json::Value& value, const string& name, map<string, string>& res, string& errorMsg) {
    if (!value.isObject() || !value.isMember(name) || value[name].isNull()) {
        return true;
    }
    const Json::Value& obj = value[name];
    if (!obj.isObject()) {
        errorMsg = "member " + name + " is not an object";
        return false;
    }
    for (const auto& key : obj.getMemberNames()) {
        if (!obj[key].isString()) {
            errorMsg = "value of " + name + "." + key + " is not a string";
            return false;
        }
        res[key] = obj[key].asString();
    }
    return true;
}

} // namespace k8sagent
