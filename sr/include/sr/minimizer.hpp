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
#include <vector>
#include "sr/request.hpp"
#include "sr/response.hpp"
#include "sr/transport.hpp"

namespace sr {

// A copy of the base request with exactly one element removed.
struct Variant {
    Removal removal;
    Request request;
};

// Result of a single synchronous probe.
struct ProbeOutcome {
    bool ok = false;
    ResponseFingerprint fingerprint;
    std::string error;
};

// Removes removal.key from removal.location; absent keys are ignored.
// A form body left with no fields becomes an empty body.
void remove_element(Request& req, const Removal& removal);

// One variant per element: query params, form body (Form only), headers,
// cookies, each in stored order.
std::vector<Variant> enumerate_variants(const Request& base);

// Sends the raw text unmodified and fingerprints the response.
ProbeOutcome probe_baseline(Transport& transport,
                            const Target& target,
                            const std::string& raw_request);

// One thread and one connection per variant. Returns after every probe has
// finished; results[i] belongs to variants[i].
std::vector<ProbeResult> probe_all(Transport& transport,
                                   const Target& target,
                                   const std::vector<Variant>& variants);

// Folds the removal of every result matching the baseline onto a copy of base.
Request reduce(const Request& base,
               const ResponseFingerprint& baseline,
               const std::vector<ProbeResult>& results);

// enumerate_variants + probe_all + reduce.
//
// Single level only: removals are tested independently and folded together
// without re-validating the combination, so elements that only matter
// jointly are not detected.
Request minimize(Transport& transport,
                 const Request& base,
                 const ResponseFingerprint& baseline,
                 const Target& target);

} // namespace sr
