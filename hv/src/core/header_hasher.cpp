/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/header_hasher.hpp"
#include "hv/internal/utils.hpp"

namespace hv {

const char* hash_error_name(HashError e) {
    switch (e) {
        case HashError::None:            return "OK";
        case HashError::DecodeError:     return "DECODE_ERROR";
        case HashError::InputTooLarge:   return "INPUT_TOO_LARGE";
        case HashError::BadHeaderLength: return "BAD_HEADER_LENGTH";
    }
    return "UNKNOWN";
}

HashResult hash_btc_header(const std::string& header_hex, const HasherOptions& opt) {
    HashResult r;

    // Length guard first: nothing is allocated for oversized input.
    if (opt.max_input_hex != 0 && header_hex.size() > opt.max_input_hex) {
        r.error = HashError::InputTooLarge;
        return r;
    }

    std::string bytes;
    if (!internal::hex_to_bytes(header_hex, bytes)) {
        r.error = HashError::DecodeError;
        return r;
    }

    if (opt.require_header_len && bytes.size() != kBtcHeaderLen) {
        r.error = HashError::BadHeaderLength;
        return r;
    }

    unsigned char digest[kDigestLen];
    internal::sha256d_bin(reinterpret_cast<const unsigned char*>(bytes.data()),
                          bytes.size(), digest);

    r.ok         = true;
    r.digest_hex = internal::bytes_to_hex(digest, kDigestLen);
    return r;
}

bool block_id_hex(const std::string& digest_hex, std::string& out) {
    std::string bin;
    if (digest_hex.size() != kDigestHexLen || !internal::hex_to_bytes(digest_hex, bin)) {
        return false;
    }
    std::string rev(bin.rbegin(), bin.rend());
    out = internal::bytes_to_hex(reinterpret_cast<const unsigned char*>(rev.data()), rev.size());
    return true;
}

} // namespace hv
