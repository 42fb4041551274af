/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/minimizer.hpp"
#include "sr/codec.hpp"
#include "sr/matcher.hpp"
#include "sr/log.hpp"

#include <exception>
#include <functional>
#include <system_error>
#include <thread>
#include <vector>

namespace sr {
namespace {

void append_variants(const Request& base, Location loc, std::vector<Variant>& out) {
    for (const auto& kv : base.fields(loc)) {
        Variant v;
        v.removal = Removal{kv.first, loc};
        v.request = base;
        remove_element(v.request, v.removal);
        out.push_back(std::move(v));
    }
}

// Runs on its own thread; owns its variant's serialized text and its result slot.
void run_probe(Transport& transport, const Target& target,
               const Variant& variant, ProbeResult& slot) noexcept {
    slot.removal = variant.removal;
    try {
        const std::string raw = serialize_request(variant.request);
        std::string head, err;
        if (!transport.send(target, raw, head, err)) {
            slot.ok = false;
            slot.error = err;
        } else if (!parse_response(head, slot.fingerprint, err)) {
            slot.ok = false;
            slot.error = err;
        } else {
            slot.ok = true;
        }
    } catch (const std::exception& e) {
        slot.ok = false;
        slot.error = std::string("probe aborted: ") + e.what();
    }
}

} // namespace

void remove_element(Request& req, const Removal& removal) {
    req.fields(removal.location).erase(removal.key);
    if (req.body_type == BodyType::Form && req.form_body.empty()) {
        req.body_type = BodyType::Empty;
    }
}

std::vector<Variant> enumerate_variants(const Request& base) {
    std::vector<Variant> out;
    out.reserve(base.query_params.size() + base.form_body.size()
                + base.headers.size() + base.cookies.size());

    append_variants(base, Location::QueryParams, out);
    // JSON and empty bodies contribute nothing
    if (base.body_type == BodyType::Form) {
        append_variants(base, Location::FormBody, out);
    }
    append_variants(base, Location::Headers, out);
    append_variants(base, Location::Cookies, out);
    return out;
}

ProbeOutcome probe_baseline(Transport& transport,
                            const Target& target,
                            const std::string& raw_request)
{
    ProbeOutcome o;
    std::string head;
    if (!transport.send(target, raw_request, head, o.error)) {
        sr::log_line("[PROBE] baseline send failed: " + o.error);
        return o;
    }
    if (!parse_response(head, o.fingerprint, o.error)) {
        sr::log_line("[PROBE] baseline response rejected: " + o.error);
        return o;
    }
    o.ok = true;
    return o;
}

std::vector<ProbeResult> probe_all(Transport& transport,
                                   const Target& target,
                                   const std::vector<Variant>& variants)
{
    std::vector<ProbeResult> results(variants.size());

    std::vector<std::thread> threads;
    threads.reserve(variants.size());
    for (std::size_t i = 0; i < variants.size(); ++i) {
        try {
            threads.emplace_back(run_probe, std::ref(transport), std::cref(target),
                                 std::cref(variants[i]), std::ref(results[i]));
        } catch (const std::system_error& e) {
            // Out of threads: probe inline rather than dropping the candidate.
            sr::log_line(std::string("[PROBE] thread start failed, probing inline: ") + e.what());
            run_probe(transport, target, variants[i], results[i]);
        }
    }
    for (auto& th : threads) th.join();

    for (const auto& r : results) {
        if (!r.ok) {
            sr::log_line(std::string("[PROBE] ") + to_string(r.removal.location) + " \""
                         + r.removal.key + "\" failed: " + r.error);
        }
    }
    return results;
}

Request reduce(const Request& base,
               const ResponseFingerprint& baseline,
               const std::vector<ProbeResult>& results)
{
    Request out = base;
    for (const auto& r : results) {
        if (!probe_matches(baseline, r)) continue;
        sr::log_line(std::string("[STRIP] dropping ") + to_string(r.removal.location)
                     + " \"" + r.removal.key + "\"");
        remove_element(out, r.removal);
    }
    return out;
}

Request minimize(Transport& transport,
                 const Request& base,
                 const ResponseFingerprint& baseline,
                 const Target& target)
{
    const std::vector<Variant> variants = enumerate_variants(base);
    sr::log_line("[STRIP] probing " + std::to_string(variants.size()) + " variants against "
                 + target.host + ":" + std::to_string(target.port)
                 + (target.tls ? " (tls)" : " (plain)"));
    const std::vector<ProbeResult> results = probe_all(transport, target, variants);
    return reduce(base, baseline, results);
}

} // namespace sr
