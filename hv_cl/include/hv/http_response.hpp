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

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

// Outcome of a remote hash_btc_header call.
struct CallResult {
    bool        ok = false;      // 200 with a well-formed digest
    std::string digest_hex;      // set only when ok
    int         status_code = 0;
    std::string error_payload;   // opaque server payload when !ok
};

} // namespace hv
