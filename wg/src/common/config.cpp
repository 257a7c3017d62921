/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/server_config.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace wg {

static bool env_value(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    out = v;
    return true;
}

unsigned long parse_unsigned(const char* name, const std::string& s, unsigned long max) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        throw std::invalid_argument(std::string(name) + ": not a number: " + s);
    }
    std::size_t used = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + ": out of range: " + s);
    }
    if (used != s.size() || v > max) {
        throw std::invalid_argument(std::string(name) + ": out of range: " + s);
    }
    return v;
}

void load_env(ServerConfig& cfg) {
    std::string v;
    if (env_value(kEnvSecret, v))  cfg.webhook_secret = v;
    if (env_value(kEnvScript, v))  cfg.action_path = v;
    if (env_value(kEnvShell, v))   cfg.action_shell = v;
    if (env_value(kEnvAddress, v) && !v.empty()) cfg.bind_addr = v;
    if (env_value(kEnvPort, v) && !v.empty()) {
        cfg.port = static_cast<uint16_t>(parse_unsigned(kEnvPort, v, 65535));
    }
    if (env_value(kEnvMaxBody, v) && !v.empty()) {
        cfg.max_body = parse_unsigned(kEnvMaxBody, v, kMaxBodyLimit);
    }
}

} // namespace wg
