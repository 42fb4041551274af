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
#include "sr/request.hpp"
#include "sr/response.hpp"

namespace sr {

// Raw request text -> Request. Never fails; malformed input yields empty fields.
//
// Every key/value split (query "=", form "=", cookie "=", header ":") uses the
// same folding rule: the first piece is the key, all remaining pieces are
// concatenated WITHOUT the delimiter. "a=b=c" -> ("a", "bc"),
// "Host: h:8080" -> ("Host", "h8080").
Request parse_request(const std::string& raw);

// Request -> raw request text, LF line endings.
std::string serialize_request(const Request& req);

// Body text for the request's body type ("" for Empty).
std::string encode_body(const Request& req);

// Response header block -> fingerprint. Fails when the status code token is
// not an integer (usually TLS spoken to a plaintext port or vice versa).
bool parse_response(const std::string& header_block,
                    ResponseFingerprint& out,
                    std::string& err);

} // namespace sr
