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
// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ", used to prefix log lines.
std::string utc_log_timestamp();
} // namespace wg
