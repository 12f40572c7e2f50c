#include "ProcessRunner.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

std::string ProcessRunner::Result::Joined() const {
    std::string joined;
    for (const auto& line : output) {
        if (!joined.empty()) joined += "\n";
        joined += line;
    }
    return joined;
}

std::shared_ptr<ProcessRunner> ProcessRunner::CreateDefault() {
#if defined(_WIN32)
    return std::make_shared<Win32ProcessRunner>();
#else
    return std::make_shared<PosixProcessRunner>();
#endif
}

// Splits complete lines out of `pending`, leaving any partial tail in place.
// Carriage returns end a line too (progress bars redraw with \r).
static void DrainLines(std::string& pending, ProcessRunner::Result& result,
                       const ProcessRunner::LineCallback& on_line) {
    size_t start = 0;
    for (size_t i = 0; i < pending.size(); ++i) {
        if (pending[i] == '\n' || pending[i] == '\r') {
            if (i > start) {
                std::string line = pending.substr(start, i - start);
                if (on_line) on_line(line);
                result.output.push_back(std::move(line));
            }
            start = i + 1;
        }
    }
    pending.erase(0, start);
}

static void FlushTail(std::string& pending, ProcessRunner::Result& result,
                      const ProcessRunner::LineCallback& on_line) {
    if (!pending.empty()) {
        if (on_line) on_line(pending);
        result.output.push_back(pending);
        pending.clear();
    }
}

#if !defined(_WIN32)

#if !defined(__linux__)
// Serializes pipe creation with fork so no child inherits a descriptor
// before its close-on-exec flag is set
static std::mutex g_spawn_mutex;
#endif

// Both ends close-on-exec: a tool spawned by another worker must not keep
// this run's write end open. dup2 clears the flag on the child's copies.
static bool OpenCloexecPipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Tools like yt-dlp start helpers of their own; take the whole group down
static void KillProcessGroup(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

ProcessRunner::Result PosixProcessRunner::Run(const std::vector<std::string>& argv,
                                              std::chrono::milliseconds timeout,
                                              const LineCallback& on_line) {
    Result result;
    if (argv.empty()) {
        result.error = ErrorKind::ToolMissing;
        return result;
    }

#if !defined(__linux__)
    std::unique_lock<std::mutex> spawn_lock(g_spawn_mutex);
#endif
    int out_pipe[2];
    int err_pipe[2];  // reports exec failure; closed on successful exec
    if (!OpenCloexecPipe(out_pipe)) {
        result.error = ErrorKind::ToolMissing;
        return result;
    }
    if (!OpenCloexecPipe(err_pipe)) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.error = ErrorKind::ToolMissing;
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        result.error = ErrorKind::ToolMissing;
        return result;
    }

    if (pid == 0) {
        // Own process group: a terminal Ctrl-C reaches the caller, not the tool
        setpgid(0, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        int code = errno;
        ssize_t ignored = write(err_pipe[1], &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Set from both sides so the group exists whichever runs first
    setpgid(pid, pid);
#if !defined(__linux__)
    spawn_lock.unlock();
#endif
    close(out_pipe[1]);
    close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    close(err_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(out_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = ErrorKind::ToolMissing;
        result.output.push_back(argv[0] + ": " + std::strerror(exec_errno));
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string pending;
    char buffer[4096];
    bool timed_out = false;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = poll(&pfd, 1, std::min(wait_ms, 250));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;

        ssize_t got = read(out_pipe[0], buffer, sizeof(buffer));
        if (got > 0) {
            pending.append(buffer, static_cast<size_t>(got));
            DrainLines(pending, result, on_line);
        } else if (got == 0) {
            break;  // EOF
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }
    close(out_pipe[0]);
    FlushTail(pending, result, on_line);

    int status = 0;
    if (timed_out) {
        KillProcessGroup(pid);
        waitpid(pid, &status, 0);
        result.error = ErrorKind::ProcessTimeout;
        return result;
    }

    // Output closed; give the child until the deadline to exit
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            KillProcessGroup(pid);
            waitpid(pid, &status, 0);
            result.error = ErrorKind::ProcessTimeout;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

#else

static std::string QuoteWindowsArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back('"');
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted.push_back(c);
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

ProcessRunner::Result Win32ProcessRunner::Run(const std::vector<std::string>& argv,
                                              std::chrono::milliseconds timeout,
                                              const LineCallback& on_line) {
    Result result;
    if (argv.empty()) {
        result.error = ErrorKind::ToolMissing;
        return result;
    }

    SECURITY_ATTRIBUTES sa = { sizeof(sa), nullptr, TRUE };
    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        result.error = ErrorKind::ToolMissing;
        return result;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    std::string cmdline;
    for (const auto& arg : argv) {
        if (!cmdline.empty()) cmdline += " ";
        cmdline += QuoteWindowsArgument(arg);
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = write_end;
    si.hStdError = write_end;
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, &cmdline[0], nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        CloseHandle(read_end);
        CloseHandle(write_end);
        result.error = ErrorKind::ToolMissing;
        return result;
    }
    CloseHandle(write_end);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string pending;
    char buffer[4096];
    bool timed_out = false;

    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        DWORD available = 0;
        if (!PeekNamedPipe(read_end, nullptr, 0, nullptr, &available, nullptr)) {
            break;  // writer closed
        }
        if (available == 0) {
            if (WaitForSingleObject(pi.hProcess, 50) == WAIT_OBJECT_0) {
                // Drain whatever is left after exit
                DWORD got = 0;
                while (PeekNamedPipe(read_end, nullptr, 0, nullptr, &available, nullptr) &&
                       available > 0 &&
                       ReadFile(read_end, buffer, sizeof(buffer), &got, nullptr) && got > 0) {
                    pending.append(buffer, got);
                }
                break;
            }
            continue;
        }
        DWORD got = 0;
        if (!ReadFile(read_end, buffer, sizeof(buffer), &got, nullptr) || got == 0) {
            break;
        }
        pending.append(buffer, got);
        DrainLines(pending, result, on_line);
    }
    DrainLines(pending, result, on_line);
    FlushTail(pending, result, on_line);
    CloseHandle(read_end);

    if (timed_out) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.error = ErrorKind::ProcessTimeout;
    } else {
        DWORD remaining = static_cast<DWORD>(std::max<long long>(0,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count()));
        if (WaitForSingleObject(pi.hProcess, remaining) == WAIT_TIMEOUT) {
            TerminateProcess(pi.hProcess, 1);
            WaitForSingleObject(pi.hProcess, INFINITE);
            result.error = ErrorKind::ProcessTimeout;
        } else {
            DWORD code = 0;
            GetExitCodeProcess(pi.hProcess, &code);
            result.exit_code = static_cast<int>(code);
        }
    }
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    return result;
}

#endif
