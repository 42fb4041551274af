/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#pragma once
#include <string>
#include <json/json.h>
#include "sr/field_map.hpp"

namespace sr {

enum class BodyType {
    Empty,
    Json,
    Form
};

// The four places a single removable element can live.
enum class Location {
    QueryParams,
    FormBody,
    Headers,
    Cookies
};

// Structured view of one captured request.
struct Request {
    std::string method;        // always upper-case
    std::string path;          // without query component
    FieldMap    query_params;
    std::string version;       // passed through unchanged
    FieldMap    headers;       // never contains "Cookie"
    FieldMap    cookies;

    BodyType    body_type = BodyType::Empty;
    Json::Value json_body;     // BodyType::Json only
    FieldMap    form_body;     // BodyType::Form only

    // Mutable access to one removable location.
    FieldMap&       fields(Location loc);
    const FieldMap& fields(Location loc) const;

    bool operator==(const Request& o) const;
    bool operator!=(const Request& o) const { return !(*this == o); }
};

// Identifies which single element was stripped to produce a variant.
struct Removal {
    std::string key;
    Location    location = Location::Headers;

    bool operator==(const Removal& o) const { return key == o.key && location == o.location; }
};

const char* to_string(Location loc);
const char* to_string(BodyType t);

} // namespace sr
