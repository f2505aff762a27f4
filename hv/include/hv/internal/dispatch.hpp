/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "hv/http_request.hpp"
#include "hv/server_config.hpp"
#include "hv/internal/ratelimit.hpp"

namespace hv::internal {

struct HttpReply {
    int         status = 200;
    std::string reason = "OK";
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> extra_headers;
    std::string body;
};

// Transport hooks. recv_some returns bytes read (<= 0 on EOF/error),
// send_all returns false on a short write.
struct ConnIo {
    std::function<long(char*, std::size_t)>        recv_some;
    std::function<bool(const char*, std::size_t)> send_all;
};

// {"status":"ERROR","reason":"..."} or the redacted form.
std::string make_error_body(const hv::ServerConfig& cfg, const std::string& reason);
HttpReply   make_error_reply(const hv::ServerConfig& cfg, int status,
                             const char* reason_phrase, const std::string& token);

// Route a parsed request. Never throws on bad input.
HttpReply dispatch_request(const hv::ServerConfig& cfg,
                           const std::string& peer_ip,
                           const hv::HttpRequest& R);

// Status line + headers + body.
std::string serialize_reply(const hv::ServerConfig& cfg, const HttpReply& rep, bool keep_alive);

// Read one request (head + Content-Length body). `pending` carries bytes
// between calls on the same connection: it is consumed first, and anything
// received past this request's body is left in it. False on EOF, timeout,
// malformed head or a body above cfg.max_body.
bool read_http_request(ConnIo& io, const hv::ServerConfig& cfg,
                       std::string& pending, hv::HttpRequest& R);

// Keep-alive request loop shared by the plain and TLS handlers.
void serve_connection(ConnIo& io,
                      const hv::ServerConfig& cfg,
                      const std::string& peer_ip,
                      TokenBucketMap& ip_rl);

} // namespace hv::internal
