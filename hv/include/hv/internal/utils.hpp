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
#include <cstddef>
#include <cstdint>

namespace hv::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers. hex_to_bytes is strict (even length, [0-9a-fA-F] only)
// and leaves `out` empty on failure.
int  hexval(char c);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// SHA-256 via OpenSSL. out must hold 32 bytes.
void sha256_bin(const unsigned char* p, std::size_t n, unsigned char* out);
// SHA256(SHA256(p)). out must hold 32 bytes.
void sha256d_bin(const unsigned char* p, std::size_t n, unsigned char* out);
std::string sha256_hex(const std::string& data);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Parse a non-negative decimal integer; rejects signs, junk and overflow.
bool parse_size(const std::string& s, std::size_t& out);

} // namespace hv::internal
