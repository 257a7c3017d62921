/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/time.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace wg {

std::string utc_log_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const long ms = static_cast<long>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40]{0};
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    n += static_cast<std::size_t>(std::snprintf(buf + n, sizeof(buf) - n, ".%03ldZ", ms));
    return std::string(buf, n);
}

} // namespace wg
