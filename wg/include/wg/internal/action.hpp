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

namespace wg::internal {

/**
 * Launches the configured action without waiting for it.
 *
 * The action runs as "<shell> <path>" (or "<path>" when shell is empty),
 * with stdin from /dev/null and the server environment. A detached reaper
 * thread collects the child and logs its exit status; the status is never
 * reported back to the caller.
 */
class ActionLauncher {
public:
    explicit ActionLauncher(std::string shell);

    // Returns false and fills err if the action could not be started.
    bool launch(const std::string& action_path, std::string& err) const;

private:
    std::string _shell;

    bool check_action(const std::string& action_path, std::string& err) const;
};

} // namespace wg::internal
