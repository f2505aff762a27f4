/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/server_config.hpp"
#include "hv/internal/dispatch.hpp"
#include "hv/internal/ratelimit.hpp"
#include "hv/internal/tls_ctx.hpp"
#include "hv/log.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <memory>
#include <unistd.h>

namespace hv::internal {

// Handles a single HTTPS connection: handshake, request loop, SSL shutdown.
// Closes fd when done.
void handle_connection_tls(int fd,
                           const hv::ServerConfig& cfg,
                           const std::string& peer_ip,
                           TlsContext& tls,
                           TokenBucketMap& ip_rl)
{
    timeval tv{cfg.ka_timeout_sec, 0};
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::unique_ptr<SSL, void(*)(SSL*)> ssl{SSL_new(tls.ctx()), [](SSL* s){ if (s) SSL_free(s); }};
    if (!ssl) {
        log_openssl_errors("[TLS]", "SSL_new");
        ::close(fd);
        return;
    }
    SSL_set_fd(ssl.get(), fd);

    ERR_clear_error();
    if (SSL_accept(ssl.get()) != 1) {
        hv::log_warn("[TLS] handshake failed ip=" + peer_ip);
        log_openssl_errors("[TLS]", "SSL_accept");
        ::close(fd);
        return;
    }

    SSL* s = ssl.get();
    ConnIo io;
    io.recv_some = [s](char* d, std::size_t len) -> long {
        const int n = SSL_read(s, d, static_cast<int>(len));
        if (n <= 0) {
            const int err = SSL_get_error(s, n);
            // Clean close_notify and idle keep-alive timeouts are not errors.
            if (err == SSL_ERROR_SSL) {
                log_openssl_errors("[TLS]", "SSL_read");
            }
        }
        return n;
    };
    io.send_all = [s](const char* d, std::size_t len) -> bool {
        std::size_t off = 0;
        while (off < len) {
            const int n = SSL_write(s, d + off, static_cast<int>(len - off));
            if (n <= 0) {
                const int err = SSL_get_error(s, n);
                hv::log_warn("[TLS] SSL_write failed ssl_error=" + std::to_string(err));
                if (err == SSL_ERROR_SSL) log_openssl_errors("[TLS]", "SSL_write");
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    };

    serve_connection(io, cfg, peer_ip, ip_rl);

    (void)SSL_shutdown(s);
    ssl.reset();
    ::close(fd);
}

} // namespace hv::internal
