#include "lode/process.hpp"

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace lode {

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        // Quote arguments containing whitespace
        bool needs_quotes = argv[i].empty() ||
                            argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

#ifndef _WIN32

ProcessResult SystemProcessRunner::run(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe(fds) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    spdlog::debug("spawning '{}' in {}", format_command(spec.argv),
                  spec.cwd.empty() ? "." : spec.cwd);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child process: stdout and stderr both go to the pipe
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!spec.cwd.empty()) {
            if (chdir(spec.cwd.c_str()) != 0) {
                const char* msg = "lode: cannot change to working directory\n";
                ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
                (void)ignored;
                _exit(127);
            }
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        std::string msg = "lode: cannot execute " + spec.argv[0] + ": " + strerror(errno) + "\n";
        ssize_t ignored = write(STDERR_FILENO, msg.c_str(), msg.size());
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(fds[1]);

    char buf[4096];
    for (;;) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    int status;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#else // _WIN32

ProcessResult SystemProcessRunner::run(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    SECURITY_ATTRIBUTES sa = {0};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        result.error = "CreatePipe failed: " + std::to_string(GetLastError());
        return result;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    std::string cmd_line = format_command(spec.argv);

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = write_end;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);

    PROCESS_INFORMATION pi = {0};

    spdlog::debug("spawning '{}' in {}", cmd_line, spec.cwd.empty() ? "." : spec.cwd);

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmd_line.c_str()),
        nullptr,  // Process security attributes
        nullptr,  // Thread security attributes
        TRUE,     // Inherit handles
        0,        // Creation flags
        nullptr,  // Inherit environment
        spec.cwd.empty() ? nullptr : spec.cwd.c_str(),
        &si,
        &pi
    );

    CloseHandle(write_end);

    if (!success) {
        result.error = "CreateProcess failed: " + std::to_string(GetLastError());
        CloseHandle(read_end);
        return result;
    }

    char buf[4096];
    DWORD n = 0;
    while (ReadFile(read_end, buf, sizeof(buf), &n, nullptr) && n > 0) {
        result.output.append(buf, n);
    }
    CloseHandle(read_end);

    WaitForSingleObject(pi.hProcess, INFINITE);

    DWORD exit_code;
    if (GetExitCodeProcess(pi.hProcess, &exit_code)) {
        result.exit_code = static_cast<int>(exit_code);
        result.ok = true;
    } else {
        result.error = "GetExitCodeProcess failed";
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    return result;
}

#endif // _WIN32

} // namespace lode
