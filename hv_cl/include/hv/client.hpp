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
#include <memory>
#include "hv/client_config.hpp"
#include "hv/http_response.hpp"

namespace hv {

// Keep-alive HTTP(S) client for the HeaderVerify service.
class Client {
public:
    // Throws std::runtime_error if the TLS context cannot be created.
    explicit Client(const ClientConfig& cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // POST <base_path>/v1/hash_btc_header with header_hex as body.
    // Returns false only on transport failure; a rejected input is a
    // successful call with out.ok == false.
    bool hash_btc_header(const std::string& header_hex, CallResult& out);

    // Same call as GET with ?header_hex=...
    bool hash_btc_header_get(const std::string& header_hex, CallResult& out);

    // Generic request:
    //  method: "GET" or "POST"
    //  path:   e.g. "/health" (prefixed by base_path if set)
    //  query:  map of query parameters
    bool request(const std::string& method,
                 const std::string& path,
                 const std::unordered_map<std::string,std::string>& query,
                 const std::string& body,
                 HttpResponse& out);

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace hv
