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
#include <unordered_map>
#include <cstddef>
#include "hv/client_config.hpp"

namespace hv::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to cfg.host:cfg.port with a bounded connect.
    bool open(const hv::ClientConfig& cfg);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    long recv_some(char* d, std::size_t len);

private:
    int _fd = -1;
};

// Parse an HTTP/1.x status line + headers. hdr_end_off is set to the first
// body byte.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

} // namespace hv::internal
