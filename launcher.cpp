/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <cerrno>
#include <cstring>     // For strerror
#include <fcntl.h>     // For O_CLOEXEC
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <launcher.h>

namespace AppLauncher {

std::vector<std::string> SplitCommandLine(const std::string& command_line)
{
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;

    enum { NONE, SINGLE, DOUBLE } quote = NONE;

    for (size_t pos = 0; pos < command_line.size(); ++pos) {
        char c = command_line[pos];

        if (quote == SINGLE) {
            if (c == '\'') {
                quote = NONE;
            } else {
                current += c;
            }
            continue;
        }

        if (quote == DOUBLE) {
            if (c == '"') {
                quote = NONE;
            } else if (c == '\\' && pos + 1 < command_line.size()
                       && std::strchr("\"\\$`", command_line[pos + 1]) != nullptr) {
                current += command_line[++pos];
            } else {
                current += c;
            }
            continue;
        }

        switch (c) {
        case ' ':
        case '\t':
        case '\n':
        case '\r':
            if (in_token) {
                args.push_back(current);
                current.clear();
                in_token = false;
            }
            break;
        case '\'':
            quote = SINGLE;
            in_token = true;
            break;
        case '"':
            quote = DOUBLE;
            in_token = true;
            break;
        case '\\':
            if (pos + 1 >= command_line.size()) {
                throw ConfigException("No escaped character after trailing backslash in command: " + command_line);
            }
            current += command_line[++pos];
            in_token = true;
            break;
        default:
            current += c;
            in_token = true;
            break;
        }
    }

    if (quote != NONE) {
        throw ConfigException("No closing quotation in command: " + command_line);
    }

    if (in_token) {
        args.push_back(current);
    }

    return args;
}

namespace {

bool IsExecutableFile(const fs::path& path)
{
    std::error_code ec;

    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

std::optional<fs::path> FindExecutable(const std::string& name, const Platform& platform)
{
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) {
            return fs::path(name);
        }

        return std::nullopt;
    }

    std::optional<std::string> path_env = platform.GetEnv("PATH");

    if (!path_env) {
        path_env = "/usr/local/bin:/usr/bin:/bin";
    }

    for (const auto& dir : StringSplit(*path_env, ":")) {
        // An empty entry means the current directory.
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;

        if (IsExecutableFile(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

bool PosixProcessLauncher::StartDetached(const std::vector<std::string>& argv) const
{
    if (argv.empty()) {
        error_log("%s: No command provided.",
                  __func__);
        return false;
    }

    std::vector<char*> c_argv;

    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }

    c_argv.push_back(nullptr);

    int status_pipe[2];

    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        error_log("%s: pipe2 failed: %s",
                  __func__,
                  strerror(errno));
        return false;
    }

    pid_t pid = fork();

    if (pid < 0) {
        error_log("%s: fork failed: %s",
                  __func__,
                  strerror(errno));

        close(status_pipe[0]);
        close(status_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Intermediate child. Only async-signal-safe calls from here on.
        close(status_pipe[0]);

        setsid();

        pid_t grandchild = fork();

        if (grandchild < 0) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void) ignored;
            _exit(127);
        }

        if (grandchild > 0) {
            _exit(0);
        }

        execv(c_argv[0], c_argv.data());

        // Only reached if exec failed.
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void) ignored;
        _exit(127);
    }

    close(status_pipe[1]);

    int child_status = 0;

    while (waitpid(pid, &child_status, 0) < 0 && errno == EINTR) {}

    // EOF (0 bytes) means the exec succeeded and the close-on-exec descriptor was closed.
    int exec_errno = 0;
    ssize_t bytes_read = 0;

    do {
        bytes_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (bytes_read < 0 && errno == EINTR);

    close(status_pipe[0]);

    if (bytes_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        error_log("%s: Failed to start %s: %s",
                  __func__,
                  argv[0],
                  strerror(exec_errno));
        return false;
    }

    if (bytes_read < 0) {
        error_log("%s: Unable to confirm start of %s: %s",
                  __func__,
                  argv[0],
                  strerror(errno));
        return false;
    }

    debug_log("INFO: %s: Started %s detached",
              __func__,
              argv[0]);

    return true;
}

} // namespace AppLauncher
