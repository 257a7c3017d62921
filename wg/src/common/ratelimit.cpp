/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/ratelimit.hpp"
#include <algorithm>

namespace wg::internal {

bool TokenBucketMap::allow(const std::string& key, double rate, double burst) {
    if (rate <= 0.0 || burst <= 0.0) return true;
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(_mtx);
    auto& b = _buckets[key];
    if (!b.init) {
        b.tokens = burst;
        b.last   = now;
        b.init   = true;
    }
    double elapsed = std::chrono::duration<double>(now - b.last).count();
    b.last   = now;
    b.tokens = std::min(burst, b.tokens + elapsed * rate);
    if (b.tokens >= 1.0) {
        b.tokens -= 1.0;
        return true;
    }
    return false;
}

void TokenBucketMap::gc(std::chrono::seconds max_idle) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto it = _buckets.begin(); it != _buckets.end();) {
        if (now - it->second.last > max_idle) it = _buckets.erase(it);
        else ++it;
    }
}

std::size_t TokenBucketMap::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _buckets.size();
}

} // namespace wg::internal
