/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#pragma once
#include "sr/response.hpp"

namespace sr {

// Equal content length, status code and status message. Headers are ignored.
bool fingerprints_match(const ResponseFingerprint& a, const ResponseFingerprint& b);

// False for any failed probe.
bool probe_matches(const ResponseFingerprint& baseline, const ProbeResult& r);

} // namespace sr
