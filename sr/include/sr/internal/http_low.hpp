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
#include "sr/transport_config.hpp"

namespace sr::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to target.host:target.port with timeouts.
    bool open(const sr::Target& target, const sr::TransportConfig& cfg, std::string& err);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);

    // Reads until a header terminator shows up. false + err on timeout/reset,
    // on close before any byte, or when max_total is exceeded.
    bool recv_head(std::string& out, std::size_t max_total, std::string& err);

private:
    int _fd = -1;
};

// Position just past the first "\r\n\r\n" or "\n\n", npos if none.
std::size_t find_head_end(const std::string& s);

} // namespace sr::internal
