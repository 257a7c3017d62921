/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <string>
#include <chrono>
#include <mutex>
#include <cstddef>

namespace wg::internal {

// Token-bucket map keyed by peer IP.
class TokenBucketMap {
public:
    TokenBucketMap() = default;

    // Returns true if request is allowed under (rate, burst).
    // rate <= 0 or burst <= 0 disables limiting.
    bool allow(const std::string& key, double rate, double burst);

    // Drop buckets idle for longer than max_idle (they would be full anyway).
    void gc(std::chrono::seconds max_idle);

    std::size_t size() const;

private:
    struct Bucket {
        double tokens = 0.0;
        std::chrono::steady_clock::time_point last{};
        bool init = false;
    };

    mutable std::mutex _mtx;
    std::unordered_map<std::string, Bucket> _buckets;
};

} // namespace wg::internal
