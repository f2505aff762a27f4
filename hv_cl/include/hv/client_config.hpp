/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include "hv/types.hpp"

namespace hv {

// Public client configuration. Per-instance; thread-safe at call level.
struct ClientConfig {
    hv::Transport transport = hv::Transport::Plain;

    // Endpoint
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string   base_path = "";   // optional path prefix, e.g. "/api"

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect + TLS handshake
    int io_timeout_sec      = 5;   // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // TLS
    bool tls_verify_peer = true;       // verify server certificate + hostname
    std::string tls_ca_file;           // optional CA file path
    std::string tls_sni;               // optional SNI servername override
    std::string tls_client_cert_file;  // optional mTLS
    std::string tls_client_key_file;  // optional mTLS

    // Logging ("" keeps the current log sink)
    std::string log_file = "";
};

} // namespace hv
