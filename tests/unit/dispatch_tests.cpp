/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/dispatch.hpp"
#include "hv/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace hv::internal;

namespace {

const char* const kHello = "9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50";
const char* const kHelloBlockId = "503d8319a48348cdc610a582f7bf754b5833df65038606eb48510790dfc99595";

// Feeds a fixed byte stream in small chunks and records everything written.
struct ScriptedIo {
    std::string input;
    std::size_t pos = 0;
    std::size_t chunk = 7;
    std::string output;

    ConnIo io() {
        ConnIo c;
        c.recv_some = [this](char* buf, std::size_t cap) -> long {
            if (pos >= input.size()) return 0;
            const std::size_t n = std::min({cap, chunk, input.size() - pos});
            std::memcpy(buf, input.data() + pos, n);
            pos += n;
            return static_cast<long>(n);
        };
        c.send_all = [this](const char* p, std::size_t n) {
            output.append(p, n);
            return true;
        };
        return c;
    }
};

hv::HttpRequest make_req(const char* method, const char* path, const char* query = "") {
    hv::HttpRequest r;
    r.method = method;
    r.path = path;
    r.query = query;
    r.httpver = "HTTP/1.1";
    return r;
}

std::size_t count_of(const std::string& hay, const std::string& needle) {
    std::size_t n = 0;
    for (std::size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1)) ++n;
    return n;
}

} // namespace

int main() {
    hv::set_log_file("");
    hv::ServerConfig cfg;

    {
        hv::HttpRequest r = make_req("POST", "/v1/hash_btc_header");
        r.body = "68656c6c6f";
        const HttpReply rep = dispatch_request(cfg, "127.0.0.1", r);
        const std::string want = std::string(R"({"status":"OK","hash":")") + kHello +
                                 R"(","block_id":")" + kHelloBlockId + R"("})";
        if (rep.status != 200 || rep.body != want) {
            std::cerr << "POST hash reply mismatch: " << rep.status << " " << rep.body << "\n";
            return EXIT_FAILURE;
        }
        if (rep.extra_headers.size() != 1 || rep.extra_headers[0].first != "X-HV-Digest" ||
            rep.extra_headers[0].second != kHello) {
            std::cerr << "missing X-HV-Digest header\n";
            return EXIT_FAILURE;
        }
    }

    {
        const HttpReply rep = dispatch_request(
            cfg, "127.0.0.1", make_req("GET", "/v1/hash_btc_header", "header_hex=68656C6C6F"));
        if (rep.status != 200 || rep.body.find(kHello) == std::string::npos) {
            std::cerr << "GET hash reply mismatch: " << rep.body << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        const struct { const char* method; const char* path; const char* query; const char* body;
                       int status; const char* token; } cases[] = {
            {"POST", "/v1/hash_btc_header", "", "abc", 400, "DECODE_ERROR"},
            {"POST", "/v1/hash_btc_header", "", "zz", 400, "DECODE_ERROR"},
            {"GET",  "/v1/hash_btc_header", "other=1", "", 400, "MISSING_HEADER_HEX"},
            {"GET",  "/nope", "", "", 404, "NOT_FOUND"},
            {"POST", "/health", "", "", 404, "NOT_FOUND"},
            {"PUT",  "/v1/hash_btc_header", "", "", 405, "ONLY_GET_OR_POST"},
        };
        for (const auto& c : cases) {
            hv::HttpRequest r = make_req(c.method, c.path, c.query);
            r.body = c.body;
            const HttpReply rep = dispatch_request(cfg, "127.0.0.1", r);
            const std::string want = std::string(R"({"status":"ERROR","reason":")") + c.token + R"("})";
            if (rep.status != c.status || rep.body != want || !rep.extra_headers.empty()) {
                std::cerr << c.method << " " << c.path << ": got " << rep.status << " " << rep.body << "\n";
                return EXIT_FAILURE;
            }
        }
    }

    {
        hv::ServerConfig limited = cfg;
        limited.max_input_hex = 8;
        hv::HttpRequest r = make_req("POST", "/v1/hash_btc_header");
        r.body = "68656c6c6f";
        HttpReply rep = dispatch_request(limited, "127.0.0.1", r);
        if (rep.status != 413 || rep.body.find("INPUT_TOO_LARGE") == std::string::npos) {
            std::cerr << "oversized input: " << rep.status << " " << rep.body << "\n";
            return EXIT_FAILURE;
        }

        limited = cfg;
        limited.strict_header = true;
        rep = dispatch_request(limited, "127.0.0.1", r);
        if (rep.status != 400 || rep.body.find("BAD_HEADER_LENGTH") == std::string::npos) {
            std::cerr << "strict header: " << rep.status << " " << rep.body << "\n";
            return EXIT_FAILURE;
        }

        limited.redact_errors = true;
        rep = dispatch_request(limited, "127.0.0.1", r);
        if (rep.status != 400 || rep.body != R"({"status":"ERROR"})") {
            std::cerr << "redacted body: " << rep.body << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        HttpReply rep = dispatch_request(cfg, "127.0.0.1", make_req("GET", "/health"));
        if (rep.status != 200 || rep.body != R"({"status":"OK"})") {
            std::cerr << "health: " << rep.body << "\n";
            return EXIT_FAILURE;
        }
        rep = dispatch_request(cfg, "127.0.0.1", make_req("GET", "/time"));
        if (rep.status != 200 || rep.body.find(R"("utc":")") == std::string::npos) {
            std::cerr << "time: " << rep.body << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        HttpReply rep;
        rep.body = "{}";
        const std::string ka = serialize_reply(cfg, rep, true);
        if (ka.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 ||
            ka.find("Content-Length: 2\r\n") == std::string::npos ||
            ka.find("Connection: keep-alive\r\n") == std::string::npos ||
            ka.find("Keep-Alive: timeout=5, max=100\r\n") == std::string::npos ||
            ka.substr(ka.size() - 6) != "\r\n\r\n{}") {
            std::cerr << "keep-alive serialization:\n" << ka << "\n";
            return EXIT_FAILURE;
        }
        const std::string close = serialize_reply(cfg, rep, false);
        if (close.find("Connection: close\r\n") == std::string::npos ||
            close.find("Keep-Alive:") != std::string::npos) {
            std::cerr << "close serialization:\n" << close << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        ScriptedIo s;
        s.input = "POST /v1/hash_btc_header HTTP/1.1\r\nContent-Length: 10\r\n\r\n68656c6c6f";
        ConnIo io = s.io();
        std::string pending;
        hv::HttpRequest r;
        if (!read_http_request(io, cfg, pending, r) || r.method != "POST" || r.body != "68656c6c6f" ||
            !pending.empty()) {
            std::cerr << "read_http_request failed on chunked input\n";
            return EXIT_FAILURE;
        }
        hv::HttpRequest again;
        if (read_http_request(io, cfg, pending, again)) {
            std::cerr << "read past EOF must fail\n";
            return EXIT_FAILURE;
        }
    }

    {
        hv::ServerConfig small = cfg;
        small.max_body = 4;
        ScriptedIo s;
        s.input = "POST /v1/hash_btc_header HTTP/1.1\r\nContent-Length: 10\r\n\r\n68656c6c6f";
        ConnIo io = s.io();
        std::string pending;
        hv::HttpRequest r;
        if (read_http_request(io, small, pending, r)) {
            std::cerr << "body above max_body must be refused\n";
            return EXIT_FAILURE;
        }

        ScriptedIo t;
        t.input = "POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n";
        io = t.io();
        pending.clear();
        if (read_http_request(io, cfg, pending, r)) {
            std::cerr << "non-numeric Content-Length must be refused\n";
            return EXIT_FAILURE;
        }

        ScriptedIo u;
        u.input = "POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\n6865";
        io = u.io();
        pending.clear();
        if (read_http_request(io, cfg, pending, r)) {
            std::cerr << "truncated body must fail\n";
            return EXIT_FAILURE;
        }
    }

    {
        // Two requests arriving in one segment are both answered, in order.
        ScriptedIo s;
        s.chunk = 4096;
        s.input = "POST /v1/hash_btc_header HTTP/1.1\r\nContent-Length: 10\r\n\r\n68656c6c6f"
                  "GET /health HTTP/1.1\r\nConnection: close\r\n\r\n";
        ConnIo io = s.io();
        TokenBucketMap buckets;
        serve_connection(io, cfg, "10.0.0.3", buckets);
        const std::size_t first = s.output.find(kHello);
        const std::size_t second = s.output.find(R"({"status":"OK"})");
        if (count_of(s.output, "HTTP/1.1 200 OK") != 2 || first == std::string::npos ||
            second == std::string::npos || second < first ||
            count_of(s.output, "Connection: close") != 1) {
            std::cerr << "pipelined session:\n" << s.output << "\n";
            return EXIT_FAILURE;
        }

        // The carry-over buffer also splits requests read directly.
        ScriptedIo t;
        t.chunk = 4096;
        t.input = "GET /health HTTP/1.1\r\n\r\nGET /time HTTP/1.1\r\n\r\n";
        io = t.io();
        std::string pending;
        hv::HttpRequest a, b;
        if (!read_http_request(io, cfg, pending, a) || a.path != "/health" ||
            pending != "GET /time HTTP/1.1\r\n\r\n" ||
            !read_http_request(io, cfg, pending, b) || b.path != "/time" || !pending.empty()) {
            std::cerr << "pipelined read_http_request split wrong\n";
            return EXIT_FAILURE;
        }
    }

    {
        // Three keep-alive requests; the rate limiter admits two.
        hv::ServerConfig rl = cfg;
        rl.rl_ip_rate = 0.001;
        rl.rl_ip_burst = 2.0;
        TokenBucketMap buckets;
        ScriptedIo s;
        ConnIo io = s.io();
        // Each recv returns one full request.
        const std::string one = "GET /health HTTP/1.1\r\n\r\n";
        int calls = 0;
        io.recv_some = [&](char* buf, std::size_t cap) -> long {
            if (calls++ >= 3 || cap < one.size()) return 0;
            std::memcpy(buf, one.data(), one.size());
            return static_cast<long>(one.size());
        };
        serve_connection(io, rl, "10.0.0.1", buckets);
        if (count_of(s.output, "HTTP/1.1 200 OK") != 2 ||
            count_of(s.output, "HTTP/1.1 429 Too Many Requests") != 1 ||
            s.output.find("RATE_LIMIT") == std::string::npos) {
            std::cerr << "rate limited session:\n" << s.output << "\n";
            return EXIT_FAILURE;
        }
    }

    {
        // ka_max bounds the session; the last reply closes.
        hv::ServerConfig ka = cfg;
        ka.ka_max = 2;
        TokenBucketMap buckets;
        ScriptedIo s;
        ConnIo io = s.io();
        const std::string one = "GET /health HTTP/1.1\r\n\r\n";
        int calls = 0;
        io.recv_some = [&](char* buf, std::size_t) -> long {
            if (calls++ >= 5) return 0;
            std::memcpy(buf, one.data(), one.size());
            return static_cast<long>(one.size());
        };
        serve_connection(io, ka, "10.0.0.2", buckets);
        if (count_of(s.output, "HTTP/1.1 200 OK") != 2 ||
            count_of(s.output, "Connection: keep-alive") != 1 ||
            count_of(s.output, "Connection: close") != 1) {
            std::cerr << "ka_max session:\n" << s.output << "\n";
            return EXIT_FAILURE;
        }
    }

    std::cout << "dispatch_tests: OK\n";
    return EXIT_SUCCESS;
}
