/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/server.hpp"
#include "hv/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <thread>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Per-connection handlers provided by http_plain.cpp / http_tls.cpp.
namespace hv::internal {

void handle_connection_plain(int fd,
                             const hv::ServerConfig& cfg,
                             const std::string& peer_ip,
                             TokenBucketMap& ip_rl);

void handle_connection_tls(int fd,
                           const hv::ServerConfig& cfg,
                           const std::string& peer_ip,
                           TlsContext& tls,
                           TokenBucketMap& ip_rl);

} // namespace hv::internal

namespace hv {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg)
{
    std::string err;
    if (!validate_server_config(_cfg, err)) {
        throw std::runtime_error("ServerConfig: " + err);
    }

    if (_cfg.transport == Transport::Tls) {
        _tls = std::make_unique<internal::TlsContext>(_cfg);
    }

    // Idle rate-limit buckets are dropped in the background.
    if (_cfg.rl_ip_rate > 0.0) {
        _rl_gc_thread = std::thread(&Server::rl_gc_loop, this);
    }
}

Server::~Server() {
    stop();
    if (_rl_gc_thread.joinable()) {
        _rl_gc_thread.join();
    }
    // Connection threads borrow _cfg/_ip_rl/_tls; wait until they are gone.
    // Each one ends within ka_timeout_sec of its last byte.
    std::unique_lock<std::mutex> lk(_mtx);
    _cv.wait(lk, [this]{ return _active == 0; });
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(_mtx);
    if (_listen_fd >= 0) {
        ::shutdown(_listen_fd, SHUT_RDWR);
    }
    _cv.notify_all();
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        hv::log_error(std::string("socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (::bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        hv::log_error(std::string("bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (::listen(srv, 512) < 0) {
        hv::log_error(std::string("listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        _bound_port.store(ntohs(bound.sin_port), std::memory_order_release);
    } else {
        _bound_port.store(_cfg.port, std::memory_order_release);
    }
    return srv;
}

void Server::run() {
    hv::log_info("HeaderVerify server starting...");
    hv::log_info(std::string("Transport: ") +
                 (_cfg.transport == Transport::Tls ? "TLS" : "plain"));
    hv::log_info("Limits: max_body=" + std::to_string(_cfg.max_body) +
                 " max_input_hex=" + std::to_string(_cfg.max_input_hex) +
                 (_cfg.strict_header ? " strict_header=80B" : " strict_header=off"));
    if (_cfg.redact_errors) {
        hv::log_info("Error redaction: ENABLED");
    }
    if (_cfg.rl_ip_rate > 0.0 && _cfg.rl_ip_burst > 0.0) {
        hv::log_info("RL-IP: rate=" + std::to_string(_cfg.rl_ip_rate) +
                     " burst=" + std::to_string(_cfg.rl_ip_burst));
    }
    hv::log_info("KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    int srv = create_listen_socket();
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _listen_fd = srv;
    }
    hv::log_info(std::string("Listening ") +
                 (_cfg.transport == Transport::Tls ? "HTTPS" : "HTTP") +
                 " on :" + std::to_string(bound_port()));

    // stop() may have run before _listen_fd was published.
    if (!_stop.load(std::memory_order_relaxed)) {
        accept_loop(srv);
    }

    {
        std::lock_guard<std::mutex> lk(_mtx);
        _listen_fd = -1;
    }
    ::close(srv);
    _bound_port.store(0, std::memory_order_release);
    hv::log_info("Server stopped");
}

void Server::accept_loop(int srv) {
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error (EMFILE, ECONNABORTED, ...); back off briefly
            hv::log_warn(std::string("accept() failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        {
            std::lock_guard<std::mutex> lk(_mtx);
            ++_active;
        }
        // Detach a per-connection handler; it owns the fd.
        std::thread([this, fd, peer]() { on_connection(fd, peer); }).detach();
    }
}

void Server::on_connection(int fd, const std::string& peer) {
    if (_cfg.transport == Transport::Tls) {
        internal::handle_connection_tls(fd, _cfg, peer, *_tls, _ip_rl);
    } else {
        internal::handle_connection_plain(fd, _cfg, peer, _ip_rl);
    }
    std::lock_guard<std::mutex> lk(_mtx);
    --_active;
    _cv.notify_all();
}

void Server::rl_gc_loop() {
    const auto max_idle = internal::TokenBucketMap::refill_window(_cfg.rl_ip_rate, _cfg.rl_ip_burst);
    std::unique_lock<std::mutex> lk(_mtx);
    while (!_stop.load(std::memory_order_relaxed)) {
        _cv.wait_for(lk, std::chrono::seconds(1));
        if (_stop.load(std::memory_order_relaxed)) break;
        lk.unlock();
        // A bucket idle for burst/rate seconds is full again; dropping it is lossless.
        const std::size_t n = _ip_rl.prune(max_idle);
        if (n > 0) {
            hv::log_info("RL-IP: pruned " + std::to_string(n) + " idle buckets");
        }
        lk.lock();
    }
}

} // namespace hv
