/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/http_parser.hpp"
#include "hv/internal/utils.hpp"
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <strings.h> // strcasecmp

namespace hv::internal {

bool parse_request_line(const std::string& line, hv::HttpRequest& r) {
    // exactly three space-separated tokens
    const std::size_t a = line.find(' ');
    if (a == std::string::npos || a == 0) return false;
    const std::size_t b = line.find(' ', a + 1);
    if (b == std::string::npos || b == a + 1) return false;
    if (line.find(' ', b + 1) != std::string::npos) return false;

    r.method  = line.substr(0, a);
    std::string target = line.substr(a + 1, b - a - 1);
    r.httpver = line.substr(b + 1);

    if (r.httpver != "HTTP/1.1" && r.httpver != "HTTP/1.0") return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

void parse_header_lines(const std::string& block, std::size_t pos, HeaderMap& out) {
    out.clear();
    while (pos < block.size()) {
        std::size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        const std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            out[k] = v;
        }
    }
}

bool parse_request_head(const std::string& head, hv::HttpRequest& r) {
    const std::size_t line_end = head.find("\r\n");
    const std::string first = head.substr(0, line_end);
    if (!parse_request_line(first, r)) return false;
    if (line_end == std::string::npos) {
        r.headers.clear();
        return true;
    }
    parse_header_lines(head, line_end + 2, r.headers);
    return true;
}

std::unordered_map<std::string,std::string> parse_query(const std::string& q) {
    auto url_decode = [](const std::string& s){
        std::string o; o.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                const int hi = hexval(s[i+1]), lo = hexval(s[i+2]);
                if (hi >= 0 && lo >= 0) { o.push_back((char)((hi << 4) | lo)); i += 2; continue; }
            }
            if (s[i] == '+') { o.push_back(' '); continue; }
            o.push_back(s[i]);
        }
        return o;
    };
    std::unordered_map<std::string,std::string> m;
    std::size_t p = 0;
    while (p < q.size()) {
        const std::size_t amp = q.find('&', p);
        const std::size_t end = (amp == std::string::npos) ? q.size() : amp;
        const std::string pair = q.substr(p, end - p);
        if (!pair.empty()) {
            const std::size_t eq = pair.find('=');
            if (eq == std::string::npos) m[url_decode(pair)] = "";
            else m[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string::npos) break;
        p = amp + 1;
    }
    return m;
}

std::string build_query_sorted(const std::unordered_map<std::string,std::string>& params) {
    auto enc = [](const std::string& s){
        static const char* H = "0123456789ABCDEF";
        std::string out; out.reserve(s.size() * 3);
        for (unsigned char c : s) {
            if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
                out.push_back((char)c);
            } else {
                out.push_back('%');
                out.push_back(H[c >> 4]);
                out.push_back(H[c & 0xF]);
            }
        }
        return out;
    };

    std::vector<std::pair<std::string,std::string>> v(params.begin(), params.end());
    std::sort(v.begin(), v.end());
    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : v) {
        if (!first) oss << '&';
        first = false;
        oss << enc(kv.first) << '=' << enc(kv.second);
    }
    return oss.str();
}

std::string hdr_ci(const HeaderMap& H, const char* name) {
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H) {
        if (strcasecmp(kv.first.c_str(), name) == 0) return kv.second;
    }
    return {};
}

std::string hdr_ci(const hv::HttpRequest& R, const char* name) {
    return hdr_ci(R.headers, name);
}

bool should_keep_alive(const hv::HttpRequest& R) {
    const std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (R.httpver == "HTTP/1.1") {
        return conn != "close";
    }
    return conn == "keep-alive";
}

} // namespace hv::internal
