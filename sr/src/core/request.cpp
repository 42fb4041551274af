/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/request.hpp"
#include "sr/field_map.hpp"
#include <algorithm>

namespace sr {

FieldMap::FieldMap(std::initializer_list<Entry> init) {
    for (const auto& kv : init) set(kv.first, kv.second);
}

void FieldMap::set(const std::string& key, const std::string& value) {
    for (auto& kv : _entries) {
        if (kv.first == key) { kv.second = value; return; }
    }
    _entries.emplace_back(key, value);
}

bool FieldMap::erase(const std::string& key) {
    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [&](const Entry& kv){ return kv.first == key; });
    if (it == _entries.end()) return false;
    _entries.erase(it);
    return true;
}

bool FieldMap::contains(const std::string& key) const {
    return std::any_of(_entries.begin(), _entries.end(),
                       [&](const Entry& kv){ return kv.first == key; });
}

std::string FieldMap::get(const std::string& key) const {
    for (const auto& kv : _entries) {
        if (kv.first == key) return kv.second;
    }
    return {};
}

FieldMap& Request::fields(Location loc) {
    switch (loc) {
    case Location::QueryParams: return query_params;
    case Location::FormBody:    return form_body;
    case Location::Headers:     return headers;
    case Location::Cookies:     return cookies;
    }
    return headers;
}

const FieldMap& Request::fields(Location loc) const {
    return const_cast<Request*>(this)->fields(loc);
}

bool Request::operator==(const Request& o) const {
    if (method != o.method || path != o.path || version != o.version) return false;
    if (query_params != o.query_params || headers != o.headers || cookies != o.cookies) return false;
    if (body_type != o.body_type) return false;
    switch (body_type) {
    case BodyType::Empty: return true;
    case BodyType::Json:  return json_body == o.json_body;
    case BodyType::Form:  return form_body == o.form_body;
    }
    return false;
}

const char* to_string(Location loc) {
    switch (loc) {
    case Location::QueryParams: return "query-params";
    case Location::FormBody:    return "parsed-body";
    case Location::Headers:     return "headers";
    case Location::Cookies:     return "cookies";
    }
    return "?";
}

const char* to_string(BodyType t) {
    switch (t) {
    case BodyType::Empty: return "empty";
    case BodyType::Json:  return "json";
    case BodyType::Form:  return "form";
    }
    return "?";
}

} // namespace sr
