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

#include "utils/string/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace imxup {
namespace strutil {
auto ToLower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto Trim(std::string_view s) -> std::string {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

auto Split(std::string_view s, char delimiter) -> std::vector<std::string> {
  std::vector<std::string> parts;
  size_t                   start = 0;
  while (true) {
    size_t pos = s.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(s.substr(start));
      break;
    }
    parts.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

auto ReplaceAll(std::string s, std::string_view from, std::string_view to) -> std::string {
  if (from.empty()) return s;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

auto FormatTemplate(std::string text, const std::map<std::string, std::string>& vars)
    -> std::string {
  for (const auto& [key, value] : vars) {
    text = ReplaceAll(std::move(text), "{" + key + "}", value);
  }
  return text;
}

auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool {
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    unsigned char a = static_cast<unsigned char>(lhs[i]);
    unsigned char b = static_cast<unsigned char>(rhs[j]);
    if (std::isdigit(a) && std::isdigit(b)) {
      size_t i_end = i;
      size_t j_end = j;
      while (i_end < lhs.size() && std::isdigit(static_cast<unsigned char>(lhs[i_end]))) ++i_end;
      while (j_end < rhs.size() && std::isdigit(static_cast<unsigned char>(rhs[j_end]))) ++j_end;

      // Compare digit runs by value without overflowing: strip leading zeros, then length
      size_t i_nz = i;
      size_t j_nz = j;
      while (i_nz + 1 < i_end && lhs[i_nz] == '0') ++i_nz;
      while (j_nz + 1 < j_end && rhs[j_nz] == '0') ++j_nz;
      size_t a_len = i_end - i_nz;
      size_t b_len = j_end - j_nz;
      if (a_len != b_len) return a_len < b_len;
      int cmp = lhs.substr(i_nz, a_len).compare(rhs.substr(j_nz, b_len));
      if (cmp != 0) return cmp < 0;
      // Equal value: fewer leading zeros first
      if ((i_end - i) != (j_end - j)) return (i_end - i) < (j_end - j);
      i = i_end;
      j = j_end;
      continue;
    }
    int la = std::tolower(a);
    int lb = std::tolower(b);
    if (la != lb) return la < lb;
    ++i;
    ++j;
  }
  if ((lhs.size() - i) != (rhs.size() - j)) return (lhs.size() - i) < (rhs.size() - j);
  // Case-insensitively equal, keep a strict order
  return lhs < rhs;
}
};  // namespace strutil
};  // namespace imxup
