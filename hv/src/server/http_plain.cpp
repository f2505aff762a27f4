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

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <unistd.h>

namespace hv::internal {

// Handles a single plain HTTP connection and closes fd when done.
void handle_connection_plain(int fd,
                             const hv::ServerConfig& cfg,
                             const std::string& peer_ip,
                             TokenBucketMap& ip_rl)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    ConnIo io;
    io.recv_some = [fd](char* d, std::size_t len) -> long {
        ssize_t n;
        do {
            n = ::recv(fd, d, len, 0);
        } while (n < 0 && errno == EINTR);
        return static_cast<long>(n);
    };
    io.send_all = [fd](const char* d, std::size_t len) -> bool {
        std::size_t off = 0;
        while (off < len) {
            ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            off += static_cast<std::size_t>(n);
        }
        return true;
    };

    serve_connection(io, cfg, peer_ip, ip_rl);
    ::close(fd);
}

} // namespace hv::internal
