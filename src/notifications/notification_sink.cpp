// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notification_sink.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace printdeck {

DesktopNotificationSink::DesktopNotificationSink(std::string app_name, std::string program)
    : app_name_(std::move(app_name)), program_(std::move(program)) {}

const char* DesktopNotificationSink::urgency_for(NotificationPriority priority) {
    switch (priority) {
    case NotificationPriority::LOW:
        return "low";
    case NotificationPriority::NORMAL:
        return "normal";
    case NotificationPriority::HIGH:
        return "critical";
    }
    return "normal";
}

bool DesktopNotificationSink::deliver(const Notification& notification) {
    const char* urgency = urgency_for(notification.priority);

    // stderr of notify-send explains a rejected notification
    int stderr_pipe[2] = {-1, -1};
    bool capture_stderr = pipe(stderr_pipe) == 0;

    // fork/execvp: title and body contain printer-provided file names
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[DesktopNotification] fork() failed: {}", strerror(errno));
        if (capture_stderr) {
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        return false;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            if (!capture_stderr) {
                dup2(devnull, STDERR_FILENO);
            }
            close(devnull);
        }
        if (capture_stderr) {
            close(stderr_pipe[0]);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stderr_pipe[1]);
        }

        const char* argv[] = {program_.c_str(),
                              "-a",
                              app_name_.c_str(),
                              "-u",
                              urgency,
                              notification.title.c_str(),
                              notification.body.c_str(),
                              nullptr};
        execvp(argv[0], const_cast<char* const*>(argv));
        _exit(127);
    }

    std::string stderr_output;
    if (capture_stderr) {
        close(stderr_pipe[1]);
        char buf[512];
        ssize_t n;
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            stderr_output.append(buf, static_cast<size_t>(n));
            if (stderr_output.size() > 2048) {
                break;
            }
        }
        close(stderr_pipe[0]);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        spdlog::error("[DesktopNotification] waitpid() failed: {}", strerror(errno));
        return false;
    }

    if (!WIFEXITED(status)) {
        spdlog::error("[DesktopNotification] {} terminated abnormally", program_);
        return false;
    }
    int exit_code = WEXITSTATUS(status);
    if (exit_code == 127) {
        spdlog::error("[DesktopNotification] Could not run {} (not installed?)", program_);
        return false;
    }
    if (exit_code != 0) {
        while (!stderr_output.empty() &&
               (stderr_output.back() == '\n' || stderr_output.back() == '\r')) {
            stderr_output.pop_back();
        }
        spdlog::error("[DesktopNotification] {} exited with {}{}{}", program_, exit_code,
                      stderr_output.empty() ? "" : ": ", stderr_output);
        return false;
    }

    spdlog::debug("[DesktopNotification] Sent '{}' ({})", notification.title, urgency);
    return true;
}

bool LogNotificationSink::deliver(const Notification& notification) {
    spdlog::info("[Notification] {} [{}]: {} - {}", notification.printer_name,
                 notification_type_to_string(notification.type), notification.title,
                 notification.body);
    return true;
}

} // namespace printdeck
