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

namespace hv {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/v1/hash_btc_header"
    std::string query;    // "header_hex=00ff"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

} // namespace hv
