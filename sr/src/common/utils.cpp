/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sr::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string trim_copy(std::string s){
    trim_inplace(s);
    return s;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::vector<std::string> split(const std::string& s, const std::string& delim){
    std::vector<std::string> out;
    if (s.empty() || delim.empty()) {
        if (!s.empty()) out.push_back(s);
        return out;
    }
    std::size_t p = 0;
    while (true) {
        std::size_t q = s.find(delim, p);
        if (q == std::string::npos) { out.push_back(s.substr(p)); break; }
        out.push_back(s.substr(p, q - p));
        p = q + delim.size();
    }
    while (!out.empty() && out.back().empty()) out.pop_back();
    return out;
}

std::pair<std::string, std::string> fold_pair(const std::string& s, char delim){
    std::size_t first = s.find(delim);
    if (first == std::string::npos) return {s, std::string()};
    std::string value;
    value.reserve(s.size() - first);
    for (std::size_t i = first + 1; i < s.size(); ++i) {
        if (s[i] != delim) value.push_back(s[i]);
    }
    return {s.substr(0, first), value};
}

std::string normalize_newlines(const std::string& s){
    std::string o; o.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i+1] == '\n') continue;
        o.push_back(s[i]);
    }
    return o;
}

bool parse_int(const std::string& s, long long& out){
    if (s.empty() || std::isspace((unsigned char)s[0])) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

} // namespace sr::internal
