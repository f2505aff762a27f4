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
#include <string>
#include <unordered_map>
#include "hv/http_request.hpp"

namespace hv::internal {

using HeaderMap = std::unordered_map<std::string, std::string>;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, hv::HttpRequest& r);

// Parse "Name: value" lines of a header block (without the start line).
void parse_header_lines(const std::string& block, std::size_t pos, HeaderMap& out);

// Parse a complete request head (start line + headers, no trailing CRLFCRLF).
bool parse_request_head(const std::string& head, hv::HttpRequest& r);

// Parse query string into map (percent- and '+'-decoding)
std::unordered_map<std::string, std::string> parse_query(const std::string& q);

// Sorted, percent-encoded query string (client side)
std::string build_query_sorted(const std::unordered_map<std::string,std::string>& params);

// Case-insensitive header lookup
std::string hdr_ci(const HeaderMap& H, const char* name);
std::string hdr_ci(const hv::HttpRequest& R, const char* name);

// HTTP/1.1 persistent-connection rule for a request.
bool should_keep_alive(const hv::HttpRequest& R);

} // namespace hv::internal
