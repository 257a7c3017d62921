/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/log.hpp"
#include "wg/internal/time.hpp"
#include <cerrno>
#include <cstring>
#include <mutex>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace {
std::mutex g_log_mtx;
// Close-on-exec so spawned actions do not inherit the log file.
int g_log_fd = -1;

bool write_fd(int fd, const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::write(fd, s.data() + off, s.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}
} // namespace

namespace wg {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_fd >= 0) {
        ::close(g_log_fd);
        g_log_fd = -1;
    }
    if (path.empty()) return;
    g_log_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (g_log_fd < 0) {
        std::cerr << "[WARN] cannot open log file " << path << ": " << std::strerror(errno)
                  << ", logging to stdout only\n";
    }
}

void log_line(const std::string& line) {
    const std::string stamped = wg::utc_log_timestamp() + " " + line + "\n";
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_fd >= 0) {
        (void)write_fd(g_log_fd, stamped);
    }
    std::cout << stamped;
}

} // namespace wg
