/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/client.hpp"
#include "hv/header_hasher.hpp"
#include "hv/log.hpp"

#include "hv/internal/utils.hpp"
#include "hv/internal/http_parser.hpp"
#include "hv/internal/tls_cli_ctx.hpp"
#include "hv/internal/http_low.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <sstream>
#include <algorithm>
#include <mutex>
#include <memory>
#include <chrono>
#include <limits>
#include <cstring>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace {

constexpr std::size_t kMaxResponseHead = 1u << 20;
constexpr std::size_t kMaxResponseBody = 1u << 20;

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

inline void log_openssl_errors(const char* where) {
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        hv::log_error(std::string("[CLIENT] ") + where + ": " + buf);
    }
}

// TLS handshake on a non-blocking socket with a bounded deadline.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(std::max(1, timeout_sec));
    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) return true;

        const int ssl_err = ::SSL_get_error(ssl, rc);
        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) {
            ev = POLLIN;
        } else if (ssl_err == SSL_ERROR_WANT_WRITE) {
            ev = POLLOUT;
        } else if (ssl_err == SSL_ERROR_SYSCALL && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            ev = POLLIN;
        } else {
            hv::log_error("[CLIENT] SSL_connect failed: ssl_error=" + std::to_string(ssl_err));
            log_openssl_errors("SSL_connect");
            return false;
        }

        const int ms = remaining_ms(deadline);
        if (ms <= 0) {
            hv::log_error("[CLIENT] SSL_connect timeout");
            return false;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = ev;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, ms);
        } while (pr < 0 && errno == EINTR);
        if (pr <= 0) {
            hv::log_error("[CLIENT] SSL_connect poll() timeout or error");
            return false;
        }
    }
}

} // namespace

namespace hv {

struct Client::Impl {
    ClientConfig cfg;
    std::unique_ptr<internal::TlsClientContext> tls; // only for Transport::Tls

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> plain;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if (s) SSL_free(s); }};
    int served_on_conn = 0;

    explicit Impl(const ClientConfig& c) : cfg(c) {
        if (!cfg.log_file.empty()) {
            hv::set_log_file(cfg.log_file);
        }
        if (cfg.transport == Transport::Tls) {
            tls = std::make_unique<internal::TlsClientContext>(cfg);
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    void close_conn_locked() {
        if (ssl) {
            (void)SSL_shutdown(ssl.get());
            ssl.reset(nullptr);
        }
        if (plain) {
            plain->close();
            plain.reset();
        }
        served_on_conn = 0;
    }

    bool fail_tls_locked(SSL* s, const char* why) {
        SSL_free(s);
        plain->close();
        plain.reset();
        hv::log_error(std::string("[CLIENT] ") + why);
        return false;
    }

    bool open_tls_locked() {
        SSL* s = SSL_new(tls->ctx());
        if (!s) {
            log_openssl_errors("SSL_new");
            return false;
        }
        SSL_set_fd(s, plain->fd());
        const std::string sni = cfg.tls_sni.empty() ? cfg.host : cfg.tls_sni;
        SSL_set_tlsext_host_name(s, sni.c_str());

        // Chain validation alone does not pin the peer; check name or IP too.
        if (cfg.tls_verify_peer) {
            unsigned char tmp[16];
            const bool is_ip = ::inet_pton(AF_INET, sni.c_str(), tmp) == 1 ||
                               ::inet_pton(AF_INET6, sni.c_str(), tmp) == 1;
            if (is_ip) {
                X509_VERIFY_PARAM* param = SSL_get0_param(s);
                if (!param || X509_VERIFY_PARAM_set1_ip_asc(param, sni.c_str()) != 1) {
                    return fail_tls_locked(s, "X509_VERIFY_PARAM_set1_ip_asc failed");
                }
            } else if (SSL_set1_host(s, sni.c_str()) != 1) {
                return fail_tls_locked(s, "SSL_set1_host failed");
            }
        }

        const int fd = plain->fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            return fail_tls_locked(s, "fcntl(O_NONBLOCK) failed");
        }
        const bool hs_ok = ssl_connect_with_deadline(s, fd, cfg.connect_timeout_sec);
        (void)::fcntl(fd, F_SETFL, old_flags);
        if (!hs_ok) {
            return fail_tls_locked(s, "TLS handshake failed");
        }

        if (cfg.tls_verify_peer) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                hv::log_error(std::string("[CLIENT] TLS verify failed: ") + X509_verify_cert_error_string(vr));
                return fail_tls_locked(s, "peer verification rejected");
            }
        }
        ssl.reset(s);
        return true;
    }

    bool ensure_conn_locked() {
        const bool have = (cfg.transport == Transport::Tls) ? static_cast<bool>(ssl)
                                                            : static_cast<bool>(plain);
        if (have && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();

        plain = std::make_unique<internal::TcpConn>();
        if (!plain->open(cfg)) {
            plain.reset();
            return false;
        }
        if (cfg.transport == Transport::Tls && !open_tls_locked()) {
            return false;
        }
        served_on_conn = 0;
        return true;
    }

    bool send_all_locked(const std::string& data) {
        if (cfg.transport == Transport::Tls) {
            std::size_t off = 0;
            while (off < data.size()) {
                const int n = SSL_write(ssl.get(), data.data() + off, (int)(data.size() - off));
                if (n <= 0) {
                    const int err = SSL_get_error(ssl.get(), n);
                    hv::log_error("[CLIENT] SSL_write failed: ssl_error=" + std::to_string(err));
                    if (err == SSL_ERROR_SSL) log_openssl_errors("SSL_write");
                    return false;
                }
                off += (std::size_t)n;
            }
            return true;
        }
        return plain->send_all(data.data(), data.size());
    }

    long recv_some_locked(char* d, std::size_t len) {
        if (cfg.transport == Transport::Tls) {
            const int n = SSL_read(ssl.get(), d, (int)len);
            if (n <= 0) {
                const int err = SSL_get_error(ssl.get(), n);
                // ZERO_RETURN: server closed a kept-alive connection; the caller retries.
                if (err != SSL_ERROR_ZERO_RETURN) {
                    hv::log_error("[CLIENT] SSL_read failed: ssl_error=" + std::to_string(err));
                    if (err == SSL_ERROR_SSL) log_openssl_errors("SSL_read");
                }
            }
            return n;
        }
        return plain->recv_some(d, len);
    }

    bool recv_response_locked(HttpResponse& out) {
        std::string head;
        char buf[4096];
        while (head.find("\r\n\r\n") == std::string::npos) {
            const long n = recv_some_locked(buf, sizeof(buf));
            if (n <= 0) return false;
            head.append(buf, buf + n);
            if (head.size() > kMaxResponseHead) return false;
        }

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(head, hdr_end_off, out.status_code,
                                           out.status_text, out.headers)) {
            return false;
        }

        // The server always sends Content-Length.
        std::size_t content_len = 0;
        if (!internal::parse_size(internal::hdr_ci(out.headers, "Content-Length"), content_len) ||
            content_len > kMaxResponseBody) {
            return false;
        }

        out.body.clear();
        if (hdr_end_off < head.size()) {
            const std::size_t have = head.size() - hdr_end_off;
            out.body.assign(head, hdr_end_off, std::min(have, content_len));
        }
        while (out.body.size() < content_len) {
            const std::size_t need = content_len - out.body.size();
            const long n = recv_some_locked(buf, std::min(sizeof(buf), need));
            if (n <= 0) return false;
            out.body.append(buf, buf + n);
        }

        const std::string conn = internal::lower_copy(internal::hdr_ci(out.headers, "Connection"));
        ++served_on_conn;
        if (conn == "close" || served_on_conn >= cfg.ka_max) {
            close_conn_locked();
        }
        return true;
    }

    bool exchange_locked(const std::string& wire, HttpResponse& out) {
        if (!ensure_conn_locked()) return false;
        if (send_all_locked(wire) && recv_response_locked(out)) return true;
        // Drop the broken connection so the next call starts clean.
        close_conn_locked();
        return false;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

bool Client::request(const std::string& method,
                     const std::string& path,
                     const std::unordered_map<std::string,std::string>& query,
                     const std::string& body,
                     HttpResponse& out)
{
    const std::string method_up = internal::upper_copy(method);
    const std::string qstring = query.empty() ? "" : ("?" + internal::build_query_sorted(query));

    std::string full_path = _p->cfg.base_path;
    if (!full_path.empty() && full_path[0] != '/') full_path = "/" + full_path;
    full_path += path + qstring;

    std::ostringstream req;
    req << method_up << " " << full_path << " HTTP/1.1\r\n";
    req << "Host: " << _p->cfg.host << ":" << _p->cfg.port << "\r\n";
    req << "User-Agent: hv-client/1\r\n";
    req << "Accept: application/json\r\n";
    req << "Connection: keep-alive\r\n";
    if (method_up == "POST") {
        req << "Content-Type: text/plain\r\n";
        req << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n";
    if (method_up == "POST") req << body;

    std::lock_guard<std::mutex> lk(_p->mtx);
    if (_p->exchange_locked(req.str(), out)) return true;

    // A kept-alive connection may have been closed by the server between calls.
    // Retry once on a fresh connection; the call is idempotent.
    HttpResponse retry;
    if (!_p->exchange_locked(req.str(), retry)) return false;
    out = std::move(retry);
    return true;
}

static void fill_call_result(const HttpResponse& resp, CallResult& out) {
    out = CallResult{};
    out.status_code = resp.status_code;
    const std::string digest = internal::lower_copy(internal::hdr_ci(resp.headers, "X-HV-Digest"));
    std::string bin;
    if (resp.status_code == 200 && digest.size() == kDigestHexLen &&
        internal::hex_to_bytes(digest, bin)) {
        out.ok = true;
        out.digest_hex = digest;
    } else {
        out.error_payload = resp.body;
    }
}

bool Client::hash_btc_header(const std::string& header_hex, CallResult& out) {
    HttpResponse resp;
    if (!request("POST", "/v1/hash_btc_header", /*query*/{}, header_hex, resp)) return false;
    fill_call_result(resp, out);
    return true;
}

bool Client::hash_btc_header_get(const std::string& header_hex, CallResult& out) {
    HttpResponse resp;
    if (!request("GET", "/v1/hash_btc_header", {{"header_hex", header_hex}}, "", resp)) return false;
    fill_call_result(resp, out);
    return true;
}

} // namespace hv
