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

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

const char* const kGenesisHeader =
    "0100000000000000000000000000000000000000000000000000000000000000"
    "000000003ba3edfd7a7b12b27ac72c3e67768f617fc81bc3888a51323a9fb8aa"
    "4b1e5e4a29ab5f49ffff001d1dac2b7c";

bool expect_digest(const std::string& in, const std::string& want) {
    const auto r = hv::hash_btc_header(in);
    if (!r.ok) {
        std::cerr << "hash_btc_header(\"" << in << "\") failed: "
                  << hv::hash_error_name(r.error) << "\n";
        return false;
    }
    if (r.digest_hex != want) {
        std::cerr << "hash_btc_header(\"" << in << "\") = " << r.digest_hex
                  << ", expected " << want << "\n";
        return false;
    }
    return true;
}

bool expect_error(const std::string& in, hv::HashError want,
                  const hv::HasherOptions& opt = hv::HasherOptions{}) {
    const auto r = hv::hash_btc_header(in, opt);
    if (r.ok || r.error != want || !r.digest_hex.empty()) {
        std::cerr << "hash_btc_header(\"" << in.substr(0, 32) << "\"): expected "
                  << hv::hash_error_name(want) << ", got "
                  << (r.ok ? "OK" : hv::hash_error_name(r.error)) << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    // Known answers, computed independently of this code base.
    if (!expect_digest("68656c6c6f",
                       "9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50")) {
        return EXIT_FAILURE;
    }
    if (!expect_digest("",
                       "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456")) {
        return EXIT_FAILURE;
    }
    if (!expect_digest(kGenesisHeader,
                       "6fe28c0ab6f1b372c1a6a246ae63f74f931e8365e15a089c68d6190000000000")) {
        return EXIT_FAILURE;
    }

    // Output is SHA256 of the raw first digest, not of its hex text.
    {
        const std::string first_hex = hv::internal::sha256_hex("hello");
        if (first_hex != "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824") {
            std::cerr << "sha256(hello) mismatch: " << first_hex << "\n";
            return EXIT_FAILURE;
        }
        std::string first_bin;
        if (!hv::internal::hex_to_bytes(first_hex, first_bin)) {
            std::cerr << "could not decode first digest\n";
            return EXIT_FAILURE;
        }
        const std::string composed = hv::internal::sha256_hex(first_bin);
        if (!expect_digest("68656c6c6f", composed)) return EXIT_FAILURE;
        if (hv::hash_btc_header("68656c6c6f").digest_hex == hv::internal::sha256_hex(first_hex)) {
            std::cerr << "second pass must not hash the hex representation\n";
            return EXIT_FAILURE;
        }
    }

    // Case-insensitive input, lowercase output.
    {
        const auto upper = hv::hash_btc_header("AABB");
        const auto lower = hv::hash_btc_header("aabb");
        const auto mixed = hv::hash_btc_header("aAbB");
        if (!upper.ok || upper.digest_hex != lower.digest_hex || mixed.digest_hex != lower.digest_hex) {
            std::cerr << "AABB / aabb / aAbB must hash identically\n";
            return EXIT_FAILURE;
        }
        if (lower.digest_hex != "f15813fa4b03e4569a24340601ee233a4f5fde24a1a51e094409f6ae3a6e9233") {
            std::cerr << "aabb digest mismatch: " << lower.digest_hex << "\n";
            return EXIT_FAILURE;
        }
        if (hv::internal::lower_copy(upper.digest_hex) != upper.digest_hex ||
            upper.digest_hex.size() != hv::kDigestHexLen) {
            std::cerr << "digest must be 64 lowercase hex characters\n";
            return EXIT_FAILURE;
        }
    }

    // Strict decoding.
    for (const char* bad : {"0", "abc", "zz", "0g", "00 11", " 0011", "0011\n", "0x00", "-1",
                            "68656c6c6", "68656c6c6f0"}) {
        if (!expect_error(bad, hv::HashError::DecodeError)) return EXIT_FAILURE;
    }
    if (!expect_error(std::string("00\0" "0", 4), hv::HashError::DecodeError)) return EXIT_FAILURE;

    // Input bound.
    {
        hv::HasherOptions opt;
        opt.max_input_hex = 8;
        if (!expect_error("0011223344", hv::HashError::InputTooLarge, opt)) return EXIT_FAILURE;
        if (!hv::hash_btc_header("00112233", opt).ok) {
            std::cerr << "input at exactly max_input_hex must be accepted\n";
            return EXIT_FAILURE;
        }
        // The size check wins over the decode check.
        if (!expect_error("zzzzzzzzzz", hv::HashError::InputTooLarge, opt)) return EXIT_FAILURE;

        const std::string big(hv::kDefaultMaxInputHex + 2, 'a');
        if (!expect_error(big, hv::HashError::InputTooLarge)) return EXIT_FAILURE;
        opt.max_input_hex = 0;
        if (!hv::hash_btc_header(big, opt).ok) {
            std::cerr << "max_input_hex == 0 must disable the bound\n";
            return EXIT_FAILURE;
        }
    }

    // Optional 80-byte header requirement.
    {
        hv::HasherOptions opt;
        opt.require_header_len = true;
        if (!expect_error("68656c6c6f", hv::HashError::BadHeaderLength, opt)) return EXIT_FAILURE;
        if (!expect_error("", hv::HashError::BadHeaderLength, opt)) return EXIT_FAILURE;
        if (!expect_error("0g", hv::HashError::DecodeError, opt)) return EXIT_FAILURE;
        const auto r = hv::hash_btc_header(kGenesisHeader, opt);
        if (!r.ok) {
            std::cerr << "genesis header rejected in strict mode\n";
            return EXIT_FAILURE;
        }
        // Permissive by default.
        if (!hv::hash_btc_header(std::string(162, '0')).ok) {
            std::cerr << "non-80-byte input must be accepted by default\n";
            return EXIT_FAILURE;
        }
    }

    // Block identifier is the reversed digest.
    {
        std::string id;
        const auto r = hv::hash_btc_header(kGenesisHeader);
        if (!hv::block_id_hex(r.digest_hex, id) ||
            id != "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f") {
            std::cerr << "genesis block id mismatch: " << id << "\n";
            return EXIT_FAILURE;
        }
        if (hv::block_id_hex("abcd", id) || hv::block_id_hex(std::string(64, 'x'), id)) {
            std::cerr << "block_id_hex must reject malformed digests\n";
            return EXIT_FAILURE;
        }
    }

    // Hex round trip of the output.
    {
        const auto r = hv::hash_btc_header(kGenesisHeader);
        std::string bin;
        if (!hv::internal::hex_to_bytes(r.digest_hex, bin) || bin.size() != hv::kDigestLen ||
            hv::internal::bytes_to_hex(reinterpret_cast<const unsigned char*>(bin.data()), bin.size())
                != r.digest_hex) {
            std::cerr << "digest hex round trip failed\n";
            return EXIT_FAILURE;
        }
    }

    // Deterministic and independent across concurrent callers.
    {
        const std::string want = hv::hash_btc_header(kGenesisHeader).digest_hex;
        std::atomic<int> mismatches{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 500; ++i) {
                    const auto r = hv::hash_btc_header(kGenesisHeader);
                    const auto bad = hv::hash_btc_header("0g");
                    if (!r.ok || r.digest_hex != want || bad.ok) ++mismatches;
                }
            });
        }
        for (auto& th : threads) th.join();
        if (mismatches.load() != 0) {
            std::cerr << "concurrent calls disagreed " << mismatches.load() << " times\n";
            return EXIT_FAILURE;
        }
    }

    if (std::string(hv::hash_error_name(hv::HashError::DecodeError)) != "DECODE_ERROR" ||
        std::string(hv::hash_error_name(hv::HashError::InputTooLarge)) != "INPUT_TOO_LARGE" ||
        std::string(hv::hash_error_name(hv::HashError::BadHeaderLength)) != "BAD_HEADER_LENGTH") {
        std::cerr << "unexpected error tokens\n";
        return EXIT_FAILURE;
    }

    std::cout << "header_hasher_tests: OK\n";
    return EXIT_SUCCESS;
}
