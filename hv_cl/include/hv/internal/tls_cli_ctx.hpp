/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "hv/client_config.hpp"

namespace hv::internal {

// TLS client context: system or custom CA, optional mTLS certificate.
// Throws std::runtime_error when the context or a configured file fails.
class TlsClientContext {
public:
    explicit TlsClientContext(const hv::ClientConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    [[noreturn]] void fail(const char* where);
};

} // namespace hv::internal
