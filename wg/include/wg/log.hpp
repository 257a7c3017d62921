/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <string>

namespace wg {

// Thread-safe logging (stdout + optional file). Lines are UTC-timestamped.
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace wg
