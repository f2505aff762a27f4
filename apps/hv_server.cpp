// SPDX-License-Identifier: MIT
// Part of HeaderVerify (HV) project.
// apps/hv_server.cpp

#include "hv/server.hpp"
#include "hv/server_config.hpp"
#include "hv/log.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <atomic>
#include <pthread.h>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

namespace {

// Silences all console output by redirecting stdout/stderr to /dev/null.
void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0 << " [--config <file>] [--port <n>]\n"
      "  [--transport plain|tls] [--tls_cert <crt> --tls_key <key>]\n"
      "  [--tls_client_ca <ca>] [--require_client_cert 0|1]\n"
      "  [--max_body <bytes>] [--max_input_hex <chars>] [--strict_header 0|1]\n"
      "  [--redact_errors 0|1] [--rl_ip_rate <r> --rl_ip_burst <b>]\n"
      "  [--ka_timeout <sec>] [--ka_max <n>] [--log_file <path>]\n"
      "  [--quiet 0|1]                    (suppress all console logs when 1)\n";
}

// Flag names map 1:1 onto config-file keys.
const char* const kSettingFlags[] = {
    "port", "transport", "tls_cert", "tls_key", "tls_client_ca",
    "require_client_cert", "max_body", "max_input_hex", "strict_header",
    "redact_errors", "rl_ip_rate", "rl_ip_burst", "ka_timeout", "ka_max",
    "log_file",
};

bool is_setting_flag(const std::string& name) {
    for (const char* f : kSettingFlags) {
        if (name == f) return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    hv::ServerConfig cfg;
    bool quiet = false;
    std::string err;

    // Pass 1: config file, so that command-line flags override it.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i+1 < argc) {
            if (!hv::load_server_config(argv[i+1], cfg, err)) {
                std::cerr << "Config error: " << err << "\n";
                return 2;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i+1 < argc) { ++i; continue; }
        if (a == "--quiet" && i+1 < argc) { quiet = (std::string(argv[++i]) != "0"); continue; }
        if (a.rfind("--", 0) == 0 && i+1 < argc && is_setting_flag(a.substr(2))) {
            if (!hv::apply_server_setting(a.substr(2), argv[++i], cfg, err)) {
                std::cerr << "Bad argument: " << err << "\n";
                return 2;
            }
            continue;
        }
        usage(argv[0]);
        return 2;
    }

    if (!hv::validate_server_config(cfg, err)) {
        std::cerr << "Invalid configuration: " << err << "\n";
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    hv::set_log_file(cfg.log_file);

    // SIGINT/SIGTERM are taken by a dedicated thread (inherited mask) so that
    // stop() never runs inside a signal handler.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    int rc = 0;
    try {
        hv::Server srv(cfg);
        std::atomic<bool> run_done{false};
        std::atomic<bool> signalled{false};
        std::thread sig_thread([&srv, &sigs, &run_done, &signalled]() {
            int sig = 0;
            const int wrc = sigwait(&sigs, &sig);
            signalled.store(true);
            if (wrc == 0 && !run_done.load()) {
                hv::log_info("signal " + std::to_string(sig) + " received, stopping");
            }
            srv.stop();
        });
        try {
            srv.run();  // blocking
        } catch (const std::exception& e) {
            hv::log_error(std::string("[FATAL] exception: ") + e.what());
            rc = 1;
        }
        // Wake the signal thread if run() ended on its own.
        run_done.store(true);
        if (!signalled.load()) {
            pthread_kill(sig_thread.native_handle(), SIGTERM);
        }
        sig_thread.join();
    } catch (const std::exception& e) {
        hv::log_error(std::string("[FATAL] exception: ") + e.what());
        return 1;
    }
    return rc;
}
