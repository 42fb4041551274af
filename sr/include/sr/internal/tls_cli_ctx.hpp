/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>

namespace sr::internal {

// TLS client context that accepts any server certificate. Built once on
// first use and shared read-only by every TLS connection in the process.
class TlsClientContext {
public:
    static const TlsClientContext& trust_all();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    TlsClientContext();
    ~TlsClientContext();

    SSL_CTX* _ctx = nullptr;
    void log_last_error(const char* where);
};

} // namespace sr::internal
