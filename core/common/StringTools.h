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
#include <algorithm>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>

namespace k8sagent {

inline bool StartWith(const std::string& input, const std::string& pattern) {
    return input.compare(0, pattern.size(), pattern) == 0;
}

inline bool EndWith(const std::string& input, const std::string& pattern) {
    if (pattern.size() > input.size()) {
        return false;
    }
    return input.compare(input.size() - pattern.size(), pattern.size(), pattern) == 0;
}

inline bool Contains(const std::string& input, const std::string& pattern) {
    return input.find(pattern) != std::string::npos;
}

std::string ToLowerCaseString(const std::string& orig);

// Trims spaces, tabs and line breaks on both ends.
std::string TrimString(const std::string& str);

template <typename T>
T StringTo(const std::string& str) {
    return boost::lexical_cast<T>(str);
}

// @return true if str is equal to "true", otherwise false.
template <>
bool StringTo<bool>(const std::string& str);

// Non-throwing variant, @val is untouched when @str is not a valid T.
template <typename T>
bool StringTo(const std::string& str, T& val) {
    T parsed;
    if (!boost::conversion::try_lexical_convert(str, parsed)) {
        return false;
    }
    val = parsed;
    return true;
}

// Split string by every char in @delim. Empty tokens are kept, so "a,,b" gives
// three tokens and "" gives one empty token.
std::vector<std::string> SplitString(const std::string& str, const std::string& delim);

std::string JoinString(const std::vector<std::string>& parts, const std::string& sep);

} // namespace k8sagent
