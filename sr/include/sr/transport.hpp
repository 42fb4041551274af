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
#include <memory>
#include "sr/transport_config.hpp"

namespace sr {

// Sends raw request bytes and returns the raw response header block.
// Implementations must be safe to call concurrently from many threads.
class Transport {
public:
    virtual ~Transport() = default;

    // On success header_block holds the response up to and including the
    // blank-line terminator. On failure err describes what went wrong.
    virtual bool send(const Target& target,
                      const std::string& raw_request,
                      std::string& header_block,
                      std::string& err) = 0;
};

// One fresh TCP (optionally TLS) connection per send(); no pooling, no keep-alive.
class SocketTransport : public Transport {
public:
    explicit SocketTransport(const TransportConfig& cfg);
    ~SocketTransport() override;

    bool send(const Target& target,
              const std::string& raw_request,
              std::string& header_block,
              std::string& err) override;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace sr
