/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace hv::internal;

int main() {
    {
        std::string out;
        if (!hex_to_bytes("00ff10Ab", out) || out != std::string("\x00\xff\x10\xab", 4)) {
            std::cerr << "hex_to_bytes(00ff10Ab) decoded wrong bytes\n";
            return EXIT_FAILURE;
        }
        if (!hex_to_bytes("", out) || !out.empty()) {
            std::cerr << "empty hex must decode to empty bytes\n";
            return EXIT_FAILURE;
        }
    }

    // A failed decode leaves no partial output behind.
    {
        std::string out = "stale";
        if (hex_to_bytes("0011zz", out) || !out.empty()) {
            std::cerr << "invalid digit must fail and clear output\n";
            return EXIT_FAILURE;
        }
        out = "stale";
        if (hex_to_bytes("001", out) || !out.empty()) {
            std::cerr << "odd length must fail and clear output\n";
            return EXIT_FAILURE;
        }
    }

    for (char c = 0; c < 127; ++c) {
        const bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if ((hexval(c) >= 0) != is_hex) {
            std::cerr << "hexval misclassifies char code " << int(c) << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        const unsigned char bytes[] = {0x00, 0x01, 0x7f, 0x80, 0xfe, 0xff};
        const std::string hex = bytes_to_hex(bytes, sizeof(bytes));
        if (hex != "00017f80feff") {
            std::cerr << "bytes_to_hex produced " << hex << "\n";
            return EXIT_FAILURE;
        }
        std::string back;
        if (!hex_to_bytes(hex, back) ||
            bytes_to_hex(reinterpret_cast<const unsigned char*>(back.data()), back.size()) != hex) {
            std::cerr << "hex round trip failed\n";
            return EXIT_FAILURE;
        }
    }

    // FIPS 180-2 "abc" vector and its double hash.
    {
        if (sha256_hex("abc") != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
            std::cerr << "sha256(abc) mismatch\n";
            return EXIT_FAILURE;
        }
        unsigned char d[32];
        sha256d_bin(reinterpret_cast<const unsigned char*>("abc"), 3, d);
        if (bytes_to_hex(d, 32) != "4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358") {
            std::cerr << "sha256d(abc) mismatch: " << bytes_to_hex(d, 32) << "\n";
            return EXIT_FAILURE;
        }
        sha256_bin(nullptr, 0, d);
        if (bytes_to_hex(d, 32) != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
            std::cerr << "sha256(empty) mismatch\n";
            return EXIT_FAILURE;
        }
    }

    {
        std::string s = " \t value \r\n";
        trim_inplace(s);
        if (s != "value") {
            std::cerr << "trim_inplace left '" << s << "'\n";
            return EXIT_FAILURE;
        }
        std::size_t n = 0;
        if (!parse_size("131072", n) || n != 131072 || parse_size("", n) || parse_size("-1", n) ||
            parse_size("12a", n) || parse_size("99999999999999999999", n)) {
            std::cerr << "parse_size accepted or rejected the wrong inputs\n";
            return EXIT_FAILURE;
        }
    }

    std::cout << "hex_codec_tests: OK\n";
    return EXIT_SUCCESS;
}
