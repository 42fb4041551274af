/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/codec.hpp"
#include "sr/internal/utils.hpp"

#include <json/json.h>

#include <limits>
#include <memory>
#include <sstream>
#include <vector>

namespace sr {
namespace {

using internal::fold_pair;
using internal::split;
using internal::trim_copy;

std::vector<std::string> trimmed_lines(const std::string& text) {
    std::vector<std::string> lines = split(text, "\n");
    for (auto& l : lines) internal::trim_inplace(l);
    return lines;
}

// "k=v&k=v" style lists (query string, form body, cookie header).
// Empty pieces carry no element and are skipped.
FieldMap parse_pairs(const std::string& text, const std::string& sep) {
    FieldMap m;
    for (const auto& piece : split(text, sep)) {
        const std::string p = trim_copy(piece);
        if (p.empty()) continue;
        auto kv = fold_pair(p, '=');
        m.set(kv.first, kv.second);
    }
    return m;
}

std::string join_pairs(const FieldMap& m, const char* sep) {
    std::string out;
    bool first = true;
    for (const auto& kv : m) {
        if (!first) out += sep;
        first = false;
        out += kv.first;
        out += '=';
        out += kv.second;
    }
    return out;
}

// Header lines follow the first line and stop at the first blank line.
FieldMap parse_header_lines(const std::vector<std::string>& lines) {
    FieldMap h;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) break;
        auto kv = fold_pair(lines[i], ':');
        h.set(trim_copy(kv.first), trim_copy(kv.second));
    }
    return h;
}

std::vector<std::string> space_tokens(const std::string& line) {
    std::vector<std::string> toks = split(line, " ");
    for (auto& t : toks) internal::trim_inplace(t);
    return toks;
}

bool parse_json_strict(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder b;
    b["allowComments"] = false;
    b["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());
    std::string errs;
    return reader->parse(text.data(), text.data() + text.size(), &out, &errs);
}

std::string write_json_compact(const Json::Value& v) {
    Json::StreamWriterBuilder w;
    w["indentation"] = "";
    w["emitUTF8"] = true;
    return Json::writeString(w, v);
}

void parse_body(const std::string& raw, Request& r) {
    std::vector<std::string> parts = split(raw, "\n\n");
    for (auto& p : parts) internal::trim_inplace(p);
    while (!parts.empty() && parts.back().empty()) parts.pop_back();

    r.body_type = BodyType::Empty;
    if (parts.size() <= 1) return;

    const std::string& body = parts.back();
    Json::Value v;
    if (parse_json_strict(body, v)) {
        r.body_type = BodyType::Json;
        r.json_body = v;
        return;
    }

    FieldMap form = parse_pairs(body, "&");
    if (form.empty()) return;  // only delimiters
    // The re-encoded form is what goes on the wire, so type it by that text:
    // e.g. `"a=b"&` re-encodes as the JSON string `"a=b"`.
    if (parse_json_strict(join_pairs(form, "&"), v)) {
        r.body_type = BodyType::Json;
        r.json_body = v;
        return;
    }
    r.body_type = BodyType::Form;
    r.form_body = std::move(form);
}

} // namespace

// CRLF pairs are folded to LF everywhere, body values included, before the
// body is split off at the first blank line.
Request parse_request(const std::string& raw_in) {
    const std::string raw = internal::normalize_newlines(raw_in);
    const std::vector<std::string> lines = trimmed_lines(raw);

    Request r;
    if (!lines.empty()) {
        const std::vector<std::string> toks = space_tokens(lines[0]);
        if (toks.size() > 0) r.method = internal::upper_copy(toks[0]);
        if (toks.size() > 2) r.version = toks[2];
        if (toks.size() > 1) {
            const std::string& target = toks[1];
            const std::size_t q = target.find('?');
            r.path = target.substr(0, q);
            if (q != std::string::npos) {
                r.query_params = parse_pairs(target.substr(q + 1), "&");
            }
        }
    }

    r.headers = parse_header_lines(lines);
    if (r.headers.contains("Cookie")) {
        r.cookies = parse_pairs(r.headers.get("Cookie"), ";");
        r.headers.erase("Cookie");
    }

    parse_body(raw, r);
    return r;
}

std::string encode_body(const Request& req) {
    switch (req.body_type) {
    case BodyType::Empty: return {};
    case BodyType::Json:  return write_json_compact(req.json_body);
    case BodyType::Form:  return join_pairs(req.form_body, "&");
    }
    return {};
}

std::string serialize_request(const Request& req) {
    std::ostringstream oss;
    oss << req.method << ' ' << req.path;
    if (!req.query_params.empty()) oss << '?' << join_pairs(req.query_params, "&");
    oss << ' ' << req.version;

    for (const auto& kv : req.headers) {
        oss << '\n' << kv.first << ": " << kv.second;
    }
    if (!req.cookies.empty()) {
        oss << '\n' << "Cookie: " << join_pairs(req.cookies, "; ");
    }
    oss << "\n\n";

    const bool has_body = req.body_type == BodyType::Json
                       || (req.body_type == BodyType::Form && !req.form_body.empty());
    if (has_body) {
        oss << encode_body(req) << "\n\n";
    }
    return oss.str();
}

bool parse_response(const std::string& header_block,
                    ResponseFingerprint& out,
                    std::string& err)
{
    const std::vector<std::string> lines = trimmed_lines(internal::normalize_newlines(header_block));
    if (lines.empty()) {
        err = "empty response from server";
        return false;
    }

    // "HTTP/1.1 200 OK"
    const std::vector<std::string> toks = space_tokens(lines[0]);
    long long code = 0;
    if (toks.size() < 2 || !internal::parse_int(toks[1], code)
        || code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
        err = "looks like the wrong protocol was chosen: no valid status code in \""
            + lines[0].substr(0, 64) + "\"";
        return false;
    }

    ResponseFingerprint fp;
    fp.status_code = static_cast<int>(code);
    for (std::size_t i = 2; i < toks.size(); ++i) {
        if (i > 2) fp.status_message += ' ';
        fp.status_message += toks[i];
    }
    fp.headers = parse_header_lines(lines);

    long long cl = 0;
    if (fp.headers.contains("Content-Length") &&
        internal::parse_int(fp.headers.get("Content-Length"), cl)) {
        fp.content_length = cl;
    }

    out = fp;
    return true;
}

} // namespace sr
