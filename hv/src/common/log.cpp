/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/log.hpp"
#include "hv/internal/time.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path = "hv.log";

void open_if_needed_unlocked() {
    if (!g_log_path.empty() && !g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}

void write_unlocked(const std::string& line) {
    open_if_needed_unlocked();
    if (g_log_ofs.is_open() && g_log_ofs) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    std::cout << line << '\n';
}

void log_tagged(const char* tag, const std::string& msg) {
    hv::log_line(hv::utc_iso8601_now() + " " + tag + " " + msg);
}
} // namespace

namespace hv {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_log_path = path;
    open_if_needed_unlocked();
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    write_unlocked(line);
}

void log_info(const std::string& msg)  { log_tagged("[INFO]", msg); }
void log_warn(const std::string& msg)  { log_tagged("[WARN]", msg); }
void log_error(const std::string& msg) { log_tagged("[ERROR]", msg); }

} // namespace hv
