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

namespace hv {

constexpr std::size_t kDigestLen          = 32;
constexpr std::size_t kDigestHexLen       = 2 * kDigestLen;
constexpr std::size_t kBtcHeaderLen       = 80;
constexpr std::size_t kDefaultMaxInputHex = 1u << 17; // 64 KiB decoded

enum class HashError {
    None,
    DecodeError,     // odd length or non-hex digit
    InputTooLarge,   // longer than HasherOptions::max_input_hex
    BadHeaderLength  // require_header_len set and decoded size != 80
};

// Stable reason token, e.g. "DECODE_ERROR".
const char* hash_error_name(HashError e);

struct HasherOptions {
    std::size_t max_input_hex = kDefaultMaxInputHex; // 0 = unbounded
    bool        require_header_len = false;
};

struct HashResult {
    bool        ok = false;
    HashError   error = HashError::None;
    std::string digest_hex; // 64 lowercase hex chars, set only when ok
};

// Bitcoin-style double SHA-256 of a hex-encoded byte sequence.
// The digest is returned in the byte order produced by SHA-256 (not reversed).
// Pure function: no shared state, safe to call from any thread.
HashResult hash_btc_header(const std::string& header_hex,
                           const HasherOptions& opt = HasherOptions{});

// Reverse the byte order of a 32-byte hex digest into the conventional
// block identifier. Returns false if digest_hex is not 64 hex characters.
bool block_id_hex(const std::string& digest_hex, std::string& out);

} // namespace hv
