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
#include <cstddef>

namespace wg::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers. hex_to_bytes accepts both digit cases and fails on odd length.
int  hexval(char c);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// True when every byte is printable ASCII (0x20..0x7E).
bool is_printable_ascii(const std::string& s);

std::string lower_copy(std::string s);

// Securely wipe string contents
void secure_wipe(std::string& s);

} // namespace wg::internal
