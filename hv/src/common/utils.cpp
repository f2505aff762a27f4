/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <openssl/sha.h>

namespace hv::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool hex_to_bytes(const std::string& hex, std::string& out) {
    out.clear();
    if (hex.size() % 2) return false;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int h = hexval(hex[i]);
        const int l = hexval(hex[i+1]);
        if (h < 0 || l < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<char>((h << 4) | l));
    }
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n) {
    static const char* H = "0123456789abcdef";
    std::string s;
    s.resize(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        s[2*i]   = H[p[i] >> 4];
        s[2*i+1] = H[p[i] & 0xF];
    }
    return s;
}

void sha256_bin(const unsigned char* p, std::size_t n, unsigned char* out) {
    // Never hand OpenSSL a null pointer, even for n == 0.
    static const unsigned char kEmpty = 0;
    SHA256(n ? p : &kEmpty, n, out);
}

void sha256d_bin(const unsigned char* p, std::size_t n, unsigned char* out) {
    unsigned char first[SHA256_DIGEST_LENGTH];
    sha256_bin(p, n, first);
    SHA256(first, sizeof(first), out);
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    sha256_bin(reinterpret_cast<const unsigned char*>(data.data()), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

std::string upper_copy(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::string lower_copy(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool parse_size(const std::string& s, std::size_t& out) {
    if (s.empty() || s.size() > 19) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        return false;
    }
    unsigned long long v = 0;
    for (char c : s) v = v * 10 + static_cast<unsigned long long>(c - '0');
    if (v > std::numeric_limits<std::size_t>::max()) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace hv::internal
