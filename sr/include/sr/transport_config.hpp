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
#include <cstddef>
#include <cstdint>

namespace sr {

// Where a probe goes.
struct Target {
    std::string   host = "127.0.0.1";
    std::uint16_t port = 443;
    bool          tls  = true;
};

// Socket transport configuration. Per-instance; shared read-only by probe threads.
struct TransportConfig {
    // Timeouts
    int connect_timeout_ms = 5000; // TCP connect + TLS handshake
    int read_timeout_ms    = 5000; // recv/send timeout

    // Header block guard
    std::size_t max_header_bytes = (1u << 20);

    // TLS: certificates are never verified
    std::string tls_sni;           // optional SNI servername override
};

} // namespace sr
