/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/server_config.hpp"
#include "hv/internal/utils.hpp"
#include "hv/log.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace hv {

namespace {

bool parse_bool(const std::string& v, bool& out) {
    const std::string l = internal::lower_copy(v);
    if (l == "1" || l == "true" || l == "yes" || l == "on")  { out = true;  return true; }
    if (l == "0" || l == "false" || l == "no" || l == "off") { out = false; return true; }
    return false;
}

bool parse_int(const std::string& v, int lo, int hi, int& out) {
    std::size_t n = 0;
    if (!internal::parse_size(v, n)) return false;
    if (n < static_cast<std::size_t>(lo) || n > static_cast<std::size_t>(hi)) return false;
    out = static_cast<int>(n);
    return true;
}

bool parse_rate(const std::string& v, double& out) {
    try {
        std::size_t used = 0;
        const double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d) || d < 0.0) return false;
        out = d;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool apply_server_setting(const std::string& key, const std::string& value,
                          ServerConfig& cfg, std::string& err)
{
    bool ok = true;
    if (key == "port") {
        int p = 0;
        ok = parse_int(value, 0, 65535, p);
        if (ok) cfg.port = static_cast<uint16_t>(p);
    } else if (key == "transport") {
        const std::string t = internal::lower_copy(value);
        if (t == "plain")    cfg.transport = Transport::Plain;
        else if (t == "tls") cfg.transport = Transport::Tls;
        else ok = false;
    } else if (key == "tls_cert") {
        cfg.tls_cert_file = value;
    } else if (key == "tls_key") {
        cfg.tls_key_file = value;
    } else if (key == "tls_client_ca") {
        cfg.tls_client_ca = value;
    } else if (key == "require_client_cert") {
        ok = parse_bool(value, cfg.require_client_cert);
    } else if (key == "max_body") {
        ok = internal::parse_size(value, cfg.max_body);
    } else if (key == "max_input_hex") {
        ok = internal::parse_size(value, cfg.max_input_hex);
    } else if (key == "strict_header") {
        ok = parse_bool(value, cfg.strict_header);
    } else if (key == "redact_errors") {
        ok = parse_bool(value, cfg.redact_errors);
    } else if (key == "rl_ip_rate") {
        ok = parse_rate(value, cfg.rl_ip_rate);
    } else if (key == "rl_ip_burst") {
        ok = parse_rate(value, cfg.rl_ip_burst);
    } else if (key == "ka_timeout") {
        ok = parse_int(value, 1, 3600, cfg.ka_timeout_sec);
    } else if (key == "ka_max") {
        ok = parse_int(value, 1, std::numeric_limits<int>::max(), cfg.ka_max);
    } else if (key == "log_file") {
        cfg.log_file = value;
    } else {
        err = "unknown key '" + key + "'";
        return false;
    }
    if (!ok) {
        err = "bad value for '" + key + "': '" + value + "'";
    }
    return ok;
}

bool load_server_config(const std::string& path, ServerConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in.good()) {
        err = "cannot open config file: " + path;
        return false;
    }
    ServerConfig tmp = cfg;
    std::size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        const std::size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        internal::trim_inplace(line);
        if (line.empty()) continue;

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            err = path + ":" + std::to_string(line_no) + ": expected key = value";
            return false;
        }
        std::string k = line.substr(0, eq), v = line.substr(eq + 1);
        internal::trim_inplace(k);
        internal::trim_inplace(v);
        std::string why;
        if (k.empty() || !apply_server_setting(k, v, tmp, why)) {
            err = path + ":" + std::to_string(line_no) + ": " + (k.empty() ? "empty key" : why);
            return false;
        }
    }
    cfg = tmp;
    hv::log_info("[CONFIG] loaded " + path + " (" + std::to_string(line_no) + " lines)");
    return true;
}

bool validate_server_config(const ServerConfig& cfg, std::string& err) {
    if (cfg.transport == Transport::Tls &&
        (cfg.tls_cert_file.empty() || cfg.tls_key_file.empty())) {
        err = "TLS transport requires tls_cert and tls_key";
        return false;
    }
    if (cfg.require_client_cert && cfg.tls_client_ca.empty()) {
        err = "require_client_cert needs tls_client_ca";
        return false;
    }
    if (cfg.max_body == 0) {
        err = "max_body must be positive";
        return false;
    }
    if (cfg.ka_max < 1 || cfg.ka_timeout_sec < 1) {
        err = "ka_max and ka_timeout must be at least 1";
        return false;
    }
    if (!std::isfinite(cfg.rl_ip_rate) || !std::isfinite(cfg.rl_ip_burst) ||
        cfg.rl_ip_rate < 0.0 || cfg.rl_ip_burst < 0.0) {
        err = "rl_ip_rate and rl_ip_burst must be finite and non-negative";
        return false;
    }
    if ((cfg.rl_ip_rate > 0.0) != (cfg.rl_ip_burst > 0.0)) {
        err = "rl_ip_rate and rl_ip_burst must be set together";
        return false;
    }
    return true;
}

} // namespace hv
