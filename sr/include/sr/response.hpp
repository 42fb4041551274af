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
#include "sr/field_map.hpp"
#include "sr/request.hpp"

namespace sr {

// What a response is judged by. Headers are kept for reporting only.
struct ResponseFingerprint {
    int status_code = 0;
    std::string status_message;
    long long content_length = 0;
    FieldMap headers;
};

// Outcome of sending one variant. fingerprint is meaningless unless ok.
struct ProbeResult {
    Removal removal;
    bool ok = false;
    ResponseFingerprint fingerprint;
    std::string error;
};

} // namespace sr
