//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace imxup {
namespace strutil {
auto ToLower(std::string_view s) -> std::string;
auto Trim(std::string_view s) -> std::string;
auto Split(std::string_view s, char delimiter) -> std::vector<std::string>;
auto ReplaceAll(std::string s, std::string_view from, std::string_view to) -> std::string;

/**
 * @brief Substitute every "{key}" in text with vars[key]. Unknown placeholders stay untouched.
 */
auto FormatTemplate(std::string text, const std::map<std::string, std::string>& vars)
    -> std::string;

/**
 * @brief Explorer-style ordering: case-insensitive, runs of digits compare by numeric value, so
 * "img2.jpg" sorts before "img10.jpg".
 */
auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool;
};  // namespace strutil
};  // namespace imxup
