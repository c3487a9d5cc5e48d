/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/process.hpp"
#include "noirlings/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace noirlings {

namespace {

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drains both pipes until the child closes them.
void drain(int& outFd, int& errFd, std::string& out, std::string& err) {
    char buf[8192];
    while (outFd >= 0 || errFd >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        int* owners[2] = {nullptr, nullptr};
        std::string* sinks[2] = {nullptr, nullptr};
        if (outFd >= 0) {
            fds[count] = {outFd, POLLIN, 0};
            owners[count] = &outFd;
            sinks[count] = &out;
            ++count;
        }
        if (errFd >= 0) {
            fds[count] = {errFd, POLLIN, 0};
            owners[count] = &errFd;
            sinks[count] = &err;
            ++count;
        }

        int ready = ::poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_WARN(std::string("poll failed: ") + std::strerror(errno));
            closeFd(outFd);
            closeFd(errFd);
            return;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(*owners[i]);
            }
        }
    }
}

} // namespace

CommandResult runCommand(const std::vector<std::string>& argv, const std::filesystem::path& workingDir) {
    CommandResult result;
    if (argv.empty()) {
        result.exitCode = 127;
        result.err = "empty command";
        return result;
    }

    LOG_DEBUG("Running: " + formatCommand(argv) +
              (workingDir.empty() ? "" : " (in " + workingDir.string() + ")"));

    int outPipe[2];
    int errPipe[2];
    int execPipe[2];
    if (::pipe(outPipe) != 0) {
        result.exitCode = 127;
        result.err = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (::pipe(errPipe) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        result.exitCode = 127;
        result.err = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    // Closed on successful exec; receives errno otherwise.
    if (::pipe(execPipe) != 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        result.exitCode = 127;
        result.err = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    ::fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    const std::string cwd = workingDir.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(execPipe[0]); ::close(execPipe[1]);
        result.exitCode = 127;
        result.err = std::string("fork: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(execPipe[0]);

        int code = 0;
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            code = errno;
        } else {
            ::execvp(args[0], args.data());
            code = errno;
        }
        ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    ::close(execPipe[0]);

    int outFd = outPipe[0];
    int errFd = errPipe[0];
    drain(outFd, errFd, result.out, result.err);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG_ERROR("waitpid failed for " + argv[0] + ": " + std::strerror(errno));
            result.exitCode = 127;
            return result;
        }
    }

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        result.exitCode = 127;
        result.err = "failed to start `" + argv[0] + "`: " + std::strerror(execErrno);
        LOG_DEBUG(result.err);
        return result;
    }

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    LOG_DEBUG(argv[0] + " exited with " + std::to_string(result.exitCode));
    return result;
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) text += ' ';
        text += arg;
    }
    return text;
}

} // namespace noirlings
