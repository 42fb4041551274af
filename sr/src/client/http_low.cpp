// SPDX-License-Identifier: Apache-2.0
// Part of the StripRequest (SR) project.
// sr/src/client/http_low.cpp

#include "sr/internal/http_low.hpp"
#include "sr/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace sr::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const sr::Target& target, const sr::TransportConfig& cfg, std::string& err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(target.host.c_str(), std::to_string(target.port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = std::string("cannot resolve ") + target.host + ": " + gai_strerror(rc);
        sr::log_line("[TCP] getaddrinfo failed: " + err);
        return false;
    }

    const int connect_timeout_ms = std::max(1, cfg.connect_timeout_ms);
    int last_errno = 0;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0) { last_errno = errno; ::close(s); continue; }
        if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { last_errno = errno; ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret == 0) {
            // Connected immediately
        } else if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd     = s;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr == 0) {
                last_errno = ETIMEDOUT;
                ::close(s);
                continue;
            }
            if (pr < 0 || !(pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
                last_errno = errno;
                ::close(s);
                continue;
            }
            // Check the actual connect() status
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        const int io_ms = std::max(1, cfg.read_timeout_ms);
        timeval tv{io_ms / 1000, (io_ms % 1000) * 1000};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        err = "connection error to " + target.host + ":" + std::to_string(target.port)
            + " (" + std::strerror(last_errno ? last_errno : ECONNREFUSED) + ")";
        sr::log_line("[TCP] " + err);
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

bool TcpConn::recv_head(std::string& out, std::size_t max_total, std::string& err) {
    char buf[1024];
    while (find_head_end(out) == std::string::npos) {
        ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            // Peer closed: whatever arrived is the whole head.
            if (out.empty()) { err = "connection closed before any response"; return false; }
            return true;
        }
        if (n < 0) {
            err = (errno == EAGAIN || errno == EWOULDBLOCK)
                ? std::string("read timeout waiting for response headers")
                : std::string("socket closed unexpectedly: ") + std::strerror(errno);
            return false;
        }
        out.append(buf, buf + n);
        if (out.size() > max_total) { err = "response header block too large"; return false; }
    }
    out.resize(find_head_end(out));
    return true;
}

std::size_t find_head_end(const std::string& s) {
    const std::size_t crlf = s.find("\r\n\r\n");
    const std::size_t lf   = s.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) return std::string::npos;
    if (lf == std::string::npos || (crlf != std::string::npos && crlf < lf)) return crlf + 4;
    return lf + 2;
}

} // namespace sr::internal
