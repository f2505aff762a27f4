/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/http_low.hpp"
#include "hv/internal/http_parser.hpp"
#include "hv/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <poll.h>

namespace hv::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const hv::ClientConfig& cfg) {
    close();

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(cfg.host.c_str(), std::to_string(cfg.port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        hv::log_error(std::string("[TCP] getaddrinfo failed: ") + gai_strerror(rc));
        return false;
    }

    const int connect_timeout_ms = std::max(1, cfg.connect_timeout_sec) * 1000;

    int s_ok = -1;
    for (addrinfo* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;

        // Non-blocking connect bounded by poll().
        const int flags = ::fcntl(s, F_GETFL, 0);
        if (flags < 0 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { ::close(s); continue; }

        const int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) { ::close(s); continue; }
        if (ret < 0) {
            pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;
            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) { ::close(s); continue; }

            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                ::close(s);
                continue;
            }
        }

        // Back to blocking mode; SO_*TIMEO bound each I/O op.
        (void)::fcntl(s, F_SETFL, flags);

        int one = 1;
        (void)::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        timeval tv{std::max(1, cfg.io_timeout_sec), 0};
        (void)::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        (void)::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    ::freeaddrinfo(res);

    if (s_ok < 0) {
        hv::log_error("[TCP] connect to " + cfg.host + ":" + std::to_string(cfg.port) +
                      " failed (timed out or refused)");
        return false;
    }
    _fd = s_ok;
    return true;
}

void TcpConn::close() {
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

long TcpConn::recv_some(char* d, std::size_t len) {
    ssize_t n;
    do {
        n = ::recv(_fd, d, len, 0);
    } while (n < 0 && errno == EINTR);
    return static_cast<long>(n);
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    const std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    const std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    const std::size_t line_end = hdrs.find("\r\n");
    const std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0, 1);

    if (line_end == std::string::npos) {
        headers.clear();
        return true;
    }
    parse_header_lines(hdrs, line_end + 2, headers);
    return true;
}

} // namespace hv::internal
