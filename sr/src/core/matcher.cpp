/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/matcher.hpp"

namespace sr {

bool fingerprints_match(const ResponseFingerprint& a, const ResponseFingerprint& b) {
    // Headers vary per response (dates, trace ids, cache nodes).
    return a.content_length == b.content_length
        && a.status_code == b.status_code
        && a.status_message == b.status_message;
}

bool probe_matches(const ResponseFingerprint& baseline, const ProbeResult& r) {
    if (!r.ok) return false;
    return fingerprints_match(baseline, r.fingerprint);
}

} // namespace sr
