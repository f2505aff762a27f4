// SPDX-License-Identifier: MIT
// Part of HeaderVerify (HV) project.
// apps/hv_hash.cpp

#include "hv/header_hasher.hpp"

#include <iostream>
#include <string>
#include <vector>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " [--strict 0|1] [--block_id 0|1] [HEX ...]\n"
      "  Prints SHA256(SHA256(bytes)) for each hex argument, or for each\n"
      "  line of stdin when no argument is given.\n";
}

static bool hash_one(const std::string& hex, const hv::HasherOptions& opt, bool with_block_id) {
    const hv::HashResult r = hv::hash_btc_header(hex, opt);
    if (!r.ok) {
        std::cerr << "error: " << hv::hash_error_name(r.error) << "\n";
        return false;
    }
    std::cout << r.digest_hex;
    std::string block_id;
    if (with_block_id && hv::block_id_hex(r.digest_hex, block_id)) {
        std::cout << " " << block_id;
    }
    std::cout << "\n";
    return true;
}

int main(int argc, char** argv) {
    hv::HasherOptions opt;
    bool with_block_id = false;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--strict" && i+1 < argc) opt.require_header_len = (std::string(argv[++i]) != "0");
        else if (a == "--block_id" && i+1 < argc) with_block_id = (std::string(argv[++i]) != "0");
        else if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
        else if (a.rfind("--", 0) == 0) { usage(argv[0]); return 2; }
        else inputs.push_back(a);
    }

    bool all_ok = true;
    if (inputs.empty()) {
        for (std::string line; std::getline(std::cin, line); ) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            all_ok = hash_one(line, opt, with_block_id) && all_ok;
        }
    } else {
        for (const auto& in : inputs) {
            all_ok = hash_one(in, opt, with_block_id) && all_ok;
        }
    }
    return all_ok ? 0 : 1;
}
