/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/action.hpp"
#include "wg/log.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace wg::internal {

ActionLauncher::ActionLauncher(std::string shell)
    : _shell(std::move(shell))
{}

bool ActionLauncher::check_action(const std::string& action_path, std::string& err) const {
    struct stat st{};
    if (::stat(action_path.c_str(), &st) != 0) {
        err = "cannot stat " + action_path + ": " + std::strerror(errno);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        err = action_path + " is not a regular file";
        return false;
    }
    // The interpreter only needs to read the script; a direct exec needs +x.
    const int mode = _shell.empty() ? X_OK : R_OK;
    if (::access(action_path.c_str(), mode) != 0) {
        err = action_path + (_shell.empty() ? " is not executable: " : " is not readable: ")
            + std::strerror(errno);
        return false;
    }
    return true;
}

// Waits for the child so it does not linger as a zombie.
static void reap_child(pid_t pid, std::string action_path) {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        wg::log_line("[ACTION] waitpid failed for pid=" + std::to_string(pid) +
                     ": " + std::strerror(errno));
        return;
    }
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        wg::log_line(std::string(code == 0 ? "[ACTION] " : "[WARN] [ACTION] ") +
                     action_path + " pid=" + std::to_string(pid) +
                     " exited with code " + std::to_string(code));
    } else if (WIFSIGNALED(status)) {
        wg::log_line("[WARN] [ACTION] " + action_path + " pid=" + std::to_string(pid) +
                     " killed by signal " + std::to_string(WTERMSIG(status)));
    }
}

bool ActionLauncher::launch(const std::string& action_path, std::string& err) const {
    if (!check_action(action_path, err)) return false;

    std::vector<std::string> args;
    if (!_shell.empty()) args.push_back(_shell);
    args.push_back(action_path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    posix_spawn_file_actions_t fa;
    int rc = posix_spawn_file_actions_init(&fa);
    if (rc != 0) {
        err = std::string("posix_spawn_file_actions_init: ") + std::strerror(rc);
        return false;
    }
    rc = posix_spawn_file_actions_addopen(&fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc != 0) {
        posix_spawn_file_actions_destroy(&fa);
        err = std::string("posix_spawn_file_actions_addopen: ") + std::strerror(rc);
        return false;
    }

    // The interpreter is looked up in PATH; a direct action is exactly the
    // file check_action() examined, relative to the working directory.
    pid_t pid = -1;
    if (_shell.empty()) {
        rc = ::posix_spawn(&pid, action_path.c_str(), &fa, nullptr, argv.data(), environ);
    } else {
        rc = ::posix_spawnp(&pid, argv[0], &fa, nullptr, argv.data(), environ);
    }
    posix_spawn_file_actions_destroy(&fa);
    if (rc != 0) {
        err = "cannot spawn " + args.front() + ": " + std::strerror(rc);
        return false;
    }

    wg::log_line("[ACTION] launched " + action_path + " pid=" + std::to_string(pid));
    try {
        std::thread(reap_child, pid, action_path).detach();
    } catch (const std::system_error& e) {
        // The child is already running; only its exit status goes unreported.
        wg::log_line("[WARN] [ACTION] cannot start reaper for pid=" + std::to_string(pid) +
                     ": " + e.what());
    }
    return true;
}

} // namespace wg::internal
