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
#include <string>

// JSON utility (for jsoncpp).
namespace k8sagent {

bool ParseJsonTable(const std::string& content, Json::Value& res, std::string& errorMsg);
// Reads and parses a whole file, @errorMsg tells whether reading or parsing failed.
bool LoadJsonFile(const std::string& filePath, Json::Value& res, std::string& errorMsg);
std::string JsonToString(const Json::Value& value, bool pretty = false);

// Lenient getters: missing members or members of another type yield the default.
std::string GetStringValue(const Json::Value& value, const std::string& name, const std::string& defValue = "");
bool GetBoolValue(const Json::Value& value, const std::string& name, bool defValue = false);

// Reads an object of string members. Non-string members are rejected.
bool GetStringMap(const Json::Value& value,
                  const std::string& name,
                  std::map<std::string, std::string>& res,
                  std::string& errorMsg);

} // namespace k8sagent
