// SPDX-License-Identifier: Apache-2.0
// Part of WebhookGate (WG) project.
// apps/wg_server.cpp

#include "wg/server.hpp"
#include "wg/server_config.hpp"
#include "wg/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <csignal>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--bind 0.0.0.0] [--port 8080]\n"
         "  [--secret <s>]                   (default: $WEBHOOK_SECRET)\n"
         "  [--script <path>]                (default: $WEBHOOK_SCRIPT)\n"
         "  [--shell bash]                   (interpreter, \"\" to exec the script directly)\n"
         "  [--max_body 32768]\n"
         "  [--tls_cert <crt> --tls_key <key>] [--tls_client_ca <ca>] [--tls_require_client 0|1]\n"
         "  [--redact_errors 0|1]\n"
         "  [--rl_ip_rate <req/s> --rl_ip_burst <n>]\n"
         "  [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--log_file <path>]\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n"
         "Environment: WEBHOOK_SECRET, WEBHOOK_SCRIPT, WEBHOOK_SHELL, WEBHOOK_ADDRESS,\n"
         "             WEBHOOK_PORT, WEBHOOK_MAX_BODY (flags win over environment)\n";
}

static wg::Server* g_server = nullptr;

static void on_signal(int) {
    // close() and shutdown() are async-signal-safe
    if (g_server) g_server->stop();
}

int main(int argc, char** argv) {
    wg::ServerConfig cfg;
    bool quiet = false;

    try {
        wg::load_env(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Bad environment: " << e.what() << "\n";
        return 2;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--bind" && i+1 < argc) cfg.bind_addr = argv[++i];
            else if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)wg::parse_unsigned("--port", argv[++i], 65535);
            else if (a == "--secret" && i+1 < argc) cfg.webhook_secret = argv[++i];
            else if (a == "--script" && i+1 < argc) cfg.action_path = argv[++i];
            else if (a == "--shell" && i+1 < argc) cfg.action_shell = argv[++i];
            else if (a == "--max_body" && i+1 < argc) cfg.max_body = wg::parse_unsigned("--max_body", argv[++i], wg::kMaxBodyLimit);
            else if (a == "--tls_cert" && i+1 < argc) cfg.tls_cert_file = argv[++i];
            else if (a == "--tls_key"  && i+1 < argc) cfg.tls_key_file  = argv[++i];
            else if (a == "--tls_client_ca" && i+1 < argc) cfg.tls_client_ca = argv[++i];
            else if (a == "--tls_require_client" && i+1 < argc) cfg.require_client_cert = (std::stoi(argv[++i]) != 0);
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--rl_ip_rate" && i+1 < argc) cfg.rl_ip_rate = std::stod(argv[++i]);
            else if (a == "--rl_ip_burst" && i+1 < argc) cfg.rl_ip_burst = std::stod(argv[++i]);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Bad option: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    // One of cert/key without the other is almost certainly a typo.
    if (cfg.tls_cert_file.empty() != cfg.tls_key_file.empty()) {
        std::cerr << "TLS requires both --tls_cert and --tls_key\n";
        return 2;
    }
    if (cfg.ka_max < 1 || cfg.ka_timeout_sec < 1) {
        std::cerr << "--ka_max and --ka_timeout must be >= 1\n";
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    wg::set_log_file(cfg.log_file);

    try {
        wg::Server srv(cfg);
        g_server = &srv;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        srv.run();  // blocking
        g_server = nullptr;
    } catch (const std::exception& e) {
        g_server = nullptr;
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
