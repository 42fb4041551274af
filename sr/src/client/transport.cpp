/*
 * Part of the StripRequest (SR) project.
 *
 * SPDX-FileCopyrightText: 2025 StripRequest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of StripRequest (SR). See LICENSE for details.
 */

#include "sr/transport.hpp"
#include "sr/log.hpp"

#include "sr/internal/tls_cli_ctx.hpp"
#include "sr/internal/http_low.hpp"  // TCP connection + header terminator scan

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <cerrno>
#include <fcntl.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1
        || ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// Drain OpenSSL error stack into one string (also logged).
std::string drain_openssl_errors(const char* where) {
    std::string all;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        sr::log_line(std::string("[TLS] ") + where + ": " + buf);
        if (!all.empty()) all += "; ";
        all += buf;
    }
    return all;
}

// TLS handshake on a non-blocking socket, bounded by timeout_ms.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_ms, std::string& err) {
    if (!ssl || fd < 0) { err = "TLS not ready"; return false; }

    const auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(std::max(1, timeout_ms));

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) ev = POLLIN;
        else if (ssl_err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
        else if (ssl_err == SSL_ERROR_SYSCALL && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) ev = POLLIN;

        if (ev != 0) {
            const int ms = remaining_ms(deadline);
            if (ms <= 0) {
                err = "TLS handshake timeout";
                return false;
            }
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = ev;
            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, ms);
            } while (pr < 0 && errno == EINTR);

            if (pr <= 0) {
                err = "TLS handshake timeout";
                return false;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            err = std::string("TLS handshake failed, socket closed unexpectedly")
                + (e ? std::string(": ") + std::strerror(e) : std::string());
            drain_openssl_errors("SSL_connect");
            return false;
        }

        // Protocol error; typically a plaintext server on the other end.
        const std::string detail = drain_openssl_errors("SSL_connect");
        err = "TLS handshake failed (wrong protocol?)" + (detail.empty() ? std::string() : ": " + detail);
        return false;
    }
}

struct SslFree {
    void operator()(SSL* s) const { if (s) SSL_free(s); }
};
using SslPtr = std::unique_ptr<SSL, SslFree>;

} // namespace

namespace sr {

struct SocketTransport::Impl {
    TransportConfig cfg;

    explicit Impl(const TransportConfig& c): cfg(c) {}

    bool send_plain(const Target& target, const std::string& raw,
                    std::string& head, std::string& err)
    {
        internal::TcpConn conn;
        if (!conn.open(target, cfg, err)) return false;
        if (!conn.send_all(raw.data(), raw.size())) {
            err = "socket closed unexpectedly while sending request";
            return false;
        }
        return conn.recv_head(head, cfg.max_header_bytes, err);
    }

    bool send_tls(const Target& target, const std::string& raw,
                  std::string& head, std::string& err)
    {
        const internal::TlsClientContext& tls = internal::TlsClientContext::trust_all();
        if (!tls.ctx()) {
            err = "TLS context not available";
            return false;
        }

        internal::TcpConn conn;
        if (!conn.open(target, cfg, err)) return false;

        SslPtr ssl(SSL_new(tls.ctx()));
        if (!ssl) {
            err = "SSL_new failed: " + drain_openssl_errors("SSL_new");
            return false;
        }
        SSL_set_fd(ssl.get(), conn.fd());
        const std::string sni = cfg.tls_sni.empty() ? target.host : cfg.tls_sni;
        // RFC 6066: no server_name for IP literals
        if (!is_ip_literal(sni)) {
            SSL_set_tlsext_host_name(ssl.get(), sni.c_str());
        }

        const int fd = conn.fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            err = "fcntl(O_NONBLOCK) failed";
            return false;
        }
        const bool hs_ok = ssl_connect_with_deadline(ssl.get(), fd, cfg.connect_timeout_ms, err);
        // Restore blocking mode so SO_RCVTIMEO bounds the reads below.
        (void)::fcntl(fd, F_SETFL, old_flags);
        if (!hs_ok) {
            sr::log_line("[TLS] " + target.host + ":" + std::to_string(target.port) + " " + err);
            return false;
        }

        std::size_t off = 0;
        while (off < raw.size()) {
            const int n = SSL_write(ssl.get(), raw.data() + off, (int)(raw.size() - off));
            if (n <= 0) {
                (void)SSL_get_error(ssl.get(), n);
                err = "socket closed unexpectedly while sending request";
                return false;
            }
            off += (std::size_t)n;
        }

        char buf[1024];
        while (internal::find_head_end(head) == std::string::npos) {
            ERR_clear_error();
            const int n = SSL_read(ssl.get(), buf, sizeof(buf));
            if (n > 0) {
                head.append(buf, buf + n);
                if (head.size() > cfg.max_header_bytes) {
                    err = "response header block too large";
                    return false;
                }
                continue;
            }
            const int e = SSL_get_error(ssl.get(), n);
            if (e == SSL_ERROR_ZERO_RETURN || (e == SSL_ERROR_SYSCALL && errno == 0)) {
                if (head.empty()) { err = "connection closed before any response"; return false; }
                break;
            }
            if (e == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                err = "read timeout waiting for response headers";
            } else {
                err = "socket closed unexpectedly while reading response";
                drain_openssl_errors("SSL_read");
            }
            return false;
        }
        const std::size_t end = internal::find_head_end(head);
        if (end != std::string::npos) head.resize(end);

        SSL_shutdown(ssl.get());
        return true;
    }
};

SocketTransport::SocketTransport(const TransportConfig& cfg)
    : _p(std::make_unique<SocketTransport::Impl>(cfg)) {}

SocketTransport::~SocketTransport() = default;

bool SocketTransport::send(const Target& target,
                           const std::string& raw_request,
                           std::string& header_block,
                           std::string& err)
{
    header_block.clear();
    err.clear();
    return target.tls ? _p->send_tls(target, raw_request, header_block, err)
                      : _p->send_plain(target, raw_request, header_block, err);
}

} // namespace sr
