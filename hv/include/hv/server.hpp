/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include "hv/server_config.hpp"
#include "hv/internal/ratelimit.hpp"
#include "hv/internal/tls_ctx.hpp"

namespace hv {

// HTTP(S) front end for hash_btc_header.
class Server {
public:
    // Throws std::runtime_error on invalid config or TLS setup failure.
    explicit Server(const ServerConfig& cfg);
    ~Server();

    // Blocking run: create socket, listen and accept until stop().
    void run();

    // Thread-safe; unblocks accept() by shutting the listen socket down.
    void stop();

    // Port actually bound (useful with cfg.port == 0); 0 until listening.
    uint16_t bound_port() const { return _bound_port.load(std::memory_order_acquire); }

private:
    ServerConfig _cfg;
    internal::TokenBucketMap _ip_rl;
    std::unique_ptr<internal::TlsContext> _tls; // only for Transport::Tls
    std::atomic<bool> _stop{false};
    std::atomic<uint16_t> _bound_port{0};
    std::thread _rl_gc_thread;

    std::mutex _mtx;
    std::condition_variable _cv;
    int _listen_fd = -1;
    int _active = 0;       // live connection threads

    void rl_gc_loop();
    void accept_loop(int srv);
    void on_connection(int fd, const std::string& peer);

    // helpers
    int create_listen_socket();
};

} // namespace hv
