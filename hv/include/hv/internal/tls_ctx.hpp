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
#include <openssl/ssl.h>
#include "hv/server_config.hpp"

namespace hv::internal {

// RAII wrapper over a server-side SSL_CTX.
// Throws std::runtime_error if the certificate or key cannot be loaded.
class TlsContext {
public:
    explicit TlsContext(const hv::ServerConfig& cfg);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    [[noreturn]] void fail(const char* where);
};

// Drain the OpenSSL error queue into the log.
void log_openssl_errors(const char* tag, const char* where);

} // namespace hv::internal
