/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/internal/tls_cli_ctx.hpp"
#include "sr/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <string>

namespace sr::internal {

const TlsClientContext& TlsClientContext::trust_all() {
    // Initialized once, thread-safe; never mutated afterwards.
    static const TlsClientContext inst;
    return inst;
}

TlsClientContext::TlsClientContext() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        return;
    }

    // Probing arbitrary / self-signed endpoints: never fail on the certificate.
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);

    // Every probe must be an isolated trial; no session resumption between them.
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_OFF);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        sr::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
}

} // namespace sr::internal
