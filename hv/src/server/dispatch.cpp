/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/dispatch.hpp"
#include "hv/internal/http_parser.hpp"
#include "hv/internal/utils.hpp"
#include "hv/internal/time.hpp"
#include "hv/header_hasher.hpp"
#include "hv/log.hpp"

#include <algorithm>
#include <sstream>

namespace hv::internal {

namespace {

constexpr std::size_t kMaxHeadBytes = 1u << 20; // header abuse guard
const char* const kHashPath = "/v1/hash_btc_header";

int status_for(HashError e) {
    switch (e) {
        case HashError::InputTooLarge: return 413;
        default:                       return 400;
    }
}

const char* phrase_for(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        default:  return "Internal Server Error";
    }
}

HttpReply hash_reply(const hv::ServerConfig& cfg,
                     const std::string& peer_ip,
                     const std::string& header_hex)
{
    HasherOptions opt;
    opt.max_input_hex      = cfg.max_input_hex;
    opt.require_header_len = cfg.strict_header;

    const HashResult hr = hv::hash_btc_header(header_hex, opt);
    if (!hr.ok) {
        const int sc = status_for(hr.error);
        hv::log_warn("[" + std::to_string(sc) + "] ip=" + peer_ip +
                     " reason=" + hash_error_name(hr.error) +
                     " input_len=" + std::to_string(header_hex.size()));
        return make_error_reply(cfg, sc, phrase_for(sc), hash_error_name(hr.error));
    }

    std::string block_id;
    (void)block_id_hex(hr.digest_hex, block_id); // digest is always 64 hex here

    HttpReply rep;
    std::ostringstream os;
    os << R"({"status":"OK","hash":")" << hr.digest_hex
       << R"(","block_id":")" << block_id << R"("})";
    rep.body = os.str();
    rep.extra_headers.emplace_back("X-HV-Digest", hr.digest_hex);
    return rep;
}

} // namespace

std::string make_error_body(const hv::ServerConfig& cfg, const std::string& reason) {
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    return std::string(R"({"status":"ERROR","reason":")") + reason + R"("})";
}

HttpReply make_error_reply(const hv::ServerConfig& cfg, int status,
                           const char* reason_phrase, const std::string& token)
{
    HttpReply rep;
    rep.status = status;
    rep.reason = reason_phrase;
    rep.body   = make_error_body(cfg, token);
    return rep;
}

HttpReply dispatch_request(const hv::ServerConfig& cfg,
                           const std::string& peer_ip,
                           const hv::HttpRequest& R)
{
    if (R.method != "GET" && R.method != "POST") {
        return make_error_reply(cfg, 405, phrase_for(405), "ONLY_GET_OR_POST");
    }

    if (R.path == "/health" && R.method == "GET") {
        HttpReply rep;
        rep.body = R"({"status":"OK"})";
        return rep;
    }
    if (R.path == "/time" && R.method == "GET") {
        HttpReply rep;
        rep.body = std::string(R"({"status":"OK","utc":")") + hv::utc_iso8601_now() + R"("})";
        return rep;
    }

    if (R.path == kHashPath) {
        if (R.method == "POST") {
            return hash_reply(cfg, peer_ip, R.body);
        }
        const auto q = parse_query(R.query);
        auto it = q.find("header_hex");
        if (it == q.end()) {
            return make_error_reply(cfg, 400, phrase_for(400), "MISSING_HEADER_HEX");
        }
        return hash_reply(cfg, peer_ip, it->second);
    }

    return make_error_reply(cfg, 404, phrase_for(404), "NOT_FOUND");
}

std::string serialize_reply(const hv::ServerConfig& cfg, const HttpReply& rep, bool keep_alive) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << rep.status << " " << rep.reason << "\r\n";
    oss << "Content-Type: " << rep.content_type << "\r\n";
    for (const auto& kv : rep.extra_headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << rep.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    oss << rep.body;
    return oss.str();
}

bool read_http_request(ConnIo& io, const hv::ServerConfig& cfg,
                       std::string& pending, hv::HttpRequest& R)
{
    char buf[4096];
    std::size_t hdr_end = pending.find("\r\n\r\n");
    while (hdr_end == std::string::npos) {
        if (pending.size() > kMaxHeadBytes) return false;
        const long n = io.recv_some(buf, sizeof(buf));
        if (n <= 0) return false;
        // Resume the search just before the new bytes; the terminator may straddle them.
        const std::size_t from = pending.size() < 3 ? 0 : pending.size() - 3;
        pending.append(buf, buf + n);
        hdr_end = pending.find("\r\n\r\n", from);
    }
    if (hdr_end > kMaxHeadBytes) return false;

    if (!parse_request_head(pending.substr(0, hdr_end), R)) return false;

    std::size_t content_len = 0;
    const std::string cl = hdr_ci(R, "Content-Length");
    if (!cl.empty()) {
        if (!parse_size(cl, content_len)) return false;
        if (content_len > cfg.max_body) return false;
    }

    const std::size_t body_off = hdr_end + 4;
    while (pending.size() - body_off < content_len) {
        const std::size_t need = content_len - (pending.size() - body_off);
        const long n = io.recv_some(buf, std::min(sizeof(buf), need));
        if (n <= 0) return false;
        pending.append(buf, buf + n);
    }
    R.body.assign(pending, body_off, content_len);
    // Whatever follows belongs to the next pipelined request.
    pending.erase(0, body_off + content_len);
    return true;
}

void serve_connection(ConnIo& io,
                      const hv::ServerConfig& cfg,
                      const std::string& peer_ip,
                      TokenBucketMap& ip_rl)
{
    std::string pending; // bytes read past the previous request
    int served = 0;
    while (served < cfg.ka_max) {
        hv::HttpRequest R;
        if (!read_http_request(io, cfg, pending, R)) break;
        ++served;

        // Last request on this connection is answered with Connection: close.
        const bool ka = should_keep_alive(R) && served < cfg.ka_max;

        HttpReply rep;
        if (!ip_rl.allow(peer_ip, cfg.rl_ip_rate, cfg.rl_ip_burst)) {
            hv::log_warn("[429] ip=" + peer_ip + " reason=IP_RATE_LIMIT");
            rep = make_error_reply(cfg, 429, phrase_for(429), "RATE_LIMIT");
        } else {
            rep = dispatch_request(cfg, peer_ip, R);
        }

        const std::string wire = serialize_reply(cfg, rep, ka);
        if (!io.send_all(wire.data(), wire.size())) break;
        if (!ka) break;
    }
}

} // namespace hv::internal
