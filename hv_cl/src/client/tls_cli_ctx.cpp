/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/tls_cli_ctx.hpp"
#include "hv/log.hpp"
#include <openssl/err.h>
#include <stdexcept>

namespace hv::internal {

TlsClientContext::TlsClientContext(const hv::ClientConfig& cfg) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) fail("SSL_CTX_new");

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) fail("set_min_proto");

    // Trust store
    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            fail("load_verify_locations(CA)");
        }
    } else if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
        fail("set_default_verify_paths");
    }

    // Optional mTLS
    if (!cfg.tls_client_cert_file.empty() && !cfg.tls_client_key_file.empty()) {
        if (SSL_CTX_use_certificate_chain_file(_ctx, cfg.tls_client_cert_file.c_str()) != 1) {
            fail("use_certificate_chain_file(client)");
        }
        if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_client_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            fail("use_privatekey_file(client)");
        }
        if (SSL_CTX_check_private_key(_ctx) != 1) fail("check_private_key(client)");
    }

    SSL_CTX_set_verify(_ctx, cfg.tls_verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Enable client session cache for resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::fail(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        hv::log_error(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    throw std::runtime_error(std::string("TLS client setup failed at ") + where);
}

} // namespace hv::internal
