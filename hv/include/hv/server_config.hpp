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
#include "hv/header_hasher.hpp"

namespace hv {

struct ServerConfig {
    // Core
    Transport transport = Transport::Plain;
    uint16_t  port = 8080;          // 0 = pick an ephemeral port

    // TLS (Transport::Tls)
    std::string tls_cert_file;
    std::string tls_key_file;
    std::string tls_client_ca;
    bool        require_client_cert = false;

    // Request limits
    size_t max_body      = 256 * 1024;
    size_t max_input_hex = kDefaultMaxInputHex;
    bool   strict_header = false;   // only accept 80-byte headers

    // Error redaction
    bool redact_errors = false;

    // Per-IP rate limit (disabled when either is 0)
    double rl_ip_rate  = 0.0;
    double rl_ip_burst = 0.0;

    // Keep-alive
    int ka_timeout_sec = 5;
    int ka_max         = 100;

    // Logging
    std::string log_file = "hv.log";
};

// Load "key = value" lines from `path` into `cfg`. Keys not present in the
// file keep their current value. On failure `err` names the offending line.
bool load_server_config(const std::string& path, ServerConfig& cfg, std::string& err);

// Apply a single setting; shared by the file loader and the command line.
bool apply_server_setting(const std::string& key, const std::string& value,
                          ServerConfig& cfg, std::string& err);

// Checks cross-field constraints (TLS files present, sane limits).
bool validate_server_config(const ServerConfig& cfg, std::string& err);

} // namespace hv
