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

#include "common/StringTools.h"

#include <boost/algorithm/string.hpp>

using namespace std;

namespace k8sagent {

string ToLowerCaseString(const string& orig) {
    auto copy = orig;
    transform(copy.begin(), copy.end(), copy.begin(), ::tolower);
    return copy;
}

string TrimString(const string& str) {
    return boost::trim_copy_if(str, boost::is_any_of(" \t\r\n"));
}

template <>
bool StringTo<bool>(const string& str) {
    return str == "true";
}

vector<string> SplitString(const string& str, const string& delim) {
    vector<string> tokens;
    boost::split(tokens, str, boost::is_any_of(delim));
    return tokens;
}

string JoinString(const vector<string>& parts, const string& sep) {
    return boost::algorithm::join(parts, sep);
}

} // namespace k8sagent
