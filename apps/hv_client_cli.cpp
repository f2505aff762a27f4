// SPDX-License-Identifier: MIT
// Part of HeaderVerify (HV) project.
// apps/hv_client_cli.cpp

#include "hv/client.hpp"
#include "hv/header_hasher.hpp"
#include "hv/http_response.hpp"
#include "hv/log.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace {

// Bitcoin mainnet genesis block header (80 bytes).
const char* const kGenesisHeaderHex =
    "01000000"
    "0000000000000000000000000000000000000000000000000000000000000000"
    "3ba3edfd7a7b12b27ac72c3e67768f617fc81bc3888a51323a9fb8aa4b1e5e4a"
    "29ab5f49"
    "ffff001d"
    "1dac2b7c";

void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " [--host 127.0.0.1] [--port 8080] [--tls 0|1]\n"
      "    [--tls_ca server.crt] [--insecure 0|1] [--base_path /api]\n"
      "    [--header HEX] [--method GET|POST] [--log_file client.log]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect / TLS handshake timeout (default 2)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 2)\n"
      "\n"
      "Without --header the Bitcoin genesis block header is sent.\n";
}

} // namespace

int main(int argc, char** argv) {
    hv::ClientConfig cfg;
    cfg.connect_timeout_sec = 2;
    cfg.io_timeout_sec      = 2;
    cfg.log_file            = "client.log";

    std::string header = kGenesisHeaderHex;
    std::string method = "POST";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--host" && i+1 < argc) cfg.host = argv[++i];
            else if (a == "--port" && i+1 < argc) cfg.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            else if (a == "--tls" && i+1 < argc)
                cfg.transport = (std::stoi(argv[++i]) != 0) ? hv::Transport::Tls : hv::Transport::Plain;
            else if (a == "--tls_ca" && i+1 < argc) cfg.tls_ca_file = argv[++i];
            else if (a == "--insecure" && i+1 < argc) cfg.tls_verify_peer = (std::stoi(argv[++i]) == 0);
            else if (a == "--base_path" && i+1 < argc) cfg.base_path = argv[++i];
            else if (a == "--header" && i+1 < argc) header = argv[++i];
            else if (a == "--method" && i+1 < argc) method = argv[++i];
            else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--connect_timeout" && i+1 < argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if (a == "--io_timeout" && i+1 < argc) cfg.io_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }
    if (method != "GET" && method != "POST") {
        usage(argv[0]);
        return 2;
    }

    std::cout << "Connecting to " << (cfg.transport == hv::Transport::Tls ? "https://" : "http://")
              << cfg.host << ":" << cfg.port << "\n";
    std::cout << "Input: " << header << "\n";

    hv::CallResult res;
    try {
        hv::Client cli(cfg);
        const bool sent = (method == "GET") ? cli.hash_btc_header_get(header, res)
                                            : cli.hash_btc_header(header, res);
        if (!sent) {
            std::cerr << "request failed (transport error, see log)\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "client error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "HTTP " << res.status_code << "\n";
    if (!res.ok) {
        std::cout << "Rejected: " << res.error_payload << "\n";
        return 1;
    }
    std::cout << "Hash256:  " << res.digest_hex << "\n";
    std::string block_id;
    if (hv::block_id_hex(res.digest_hex, block_id)) {
        std::cout << "Block ID: " << block_id << "\n";
    }
    return 0;
}
