#include "src/server/process.h"
#include "src/server/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace zxcompile {

namespace fs = std::filesystem;

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void AppendCapped(std::string& target, const char* data, size_t size, size_t max_output) {
    if (target.size() >= max_output) return;
    target.append(data, std::min(size, max_output - target.size()));
}

// Reads whatever is available without blocking. Closes the fd on EOF or error.
void DrainFd(int& fd, std::string& target, size_t max_output) {
    char buffer[4096];
    while (fd >= 0) {
        ssize_t bytes = read(fd, buffer, sizeof(buffer));
        if (bytes > 0) {
            AppendCapped(target, buffer, static_cast<size_t>(bytes), max_output);
            continue;
        }
        if (bytes < 0 && errno == EINTR) continue;
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        CloseFd(fd);
    }
}

void FillStatus(WaitResult& result, int status) {
    result.exited = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.term_signal = WTERMSIG(status);
    }
}

std::optional<std::string> ReadProcFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fields of /proc/<pid>/stat after the "(comm)" entry; index 0 is the state.
std::optional<std::vector<std::string>> StatFields(pid_t pid) {
    auto stat = ReadProcFile("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return std::nullopt;
    size_t close_paren = stat->rfind(')');
    if (close_paren == std::string::npos) return std::nullopt;

    std::istringstream in(stat->substr(close_paren + 1));
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) fields.push_back(field);
    return fields;
}

} // namespace

std::string Process::CreateTempDirectory(const std::string& parent) {
    std::string pattern = parent + "/zxcompile_XXXXXX";
    std::vector<char> template_str(pattern.begin(), pattern.end());
    template_str.push_back('\0');
    char* path = mkdtemp(template_str.data());
    if (!path) {
        Logger::Error("Failed to create temporary directory under ", parent, ": ", strerror(errno));
        return "";
    }
    Logger::Debug("Created temporary directory: ", path);
    return std::string(path);
}

bool Process::RemoveDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;
    fs::remove_all(path, ec);
    if (ec) {
        Logger::Error("Failed to remove directory: ", path, " - ", ec.message());
        return false;
    }
    Logger::Debug("Removed directory: ", path);
    return true;
}

bool Process::WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        Logger::Error("Failed to open file for writing: ", path);
        return false;
    }
    out << content;
    out.close();
    return static_cast<bool>(out);
}

std::optional<std::string> Process::ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return content;
}

std::optional<SpawnedProcess> Process::Spawn(const std::vector<std::string>& argv,
                                             const SpawnOptions& options,
                                             std::string* error) {
    auto fail = [error](const std::string& message) -> std::optional<SpawnedProcess> {
        if (error) *error = message;
        Logger::Error(message);
        return std::nullopt;
    };

    if (argv.empty()) return fail("Spawn called with an empty argument list");

    // Everything the child touches is prepared before fork.
    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    const char* working_directory =
        options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &error_pipe[0], &error_pipe[1]}) {
            CloseFd(*fd);
        }
    };

    if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1 ||
        pipe2(error_pipe, O_CLOEXEC) == -1) {
        std::string reason = strerror(errno);
        close_all();
        return fail("Failed to create pipes: " + reason);
    }

    pid_t pid = fork();
    if (pid == -1) {
        std::string reason = strerror(errno);
        close_all();
        return fail("Failed to fork: " + reason);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only from here on.
        if (options.new_process_group) setpgid(0, 0);

        // The server blocks its shutdown signals; the compiler must not inherit that.
        sigset_t no_signals;
        sigemptyset(&no_signals);
        sigprocmask(SIG_SETMASK, &no_signals, nullptr);
        signal(SIGPIPE, SIG_DFL);

        int err = 0;
        if (working_directory && chdir(working_directory) == -1) {
            err = errno;
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            execvp(c_argv[0], c_argv.data());
            err = errno;
        }
        ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    if (options.new_process_group) setpgid(pid, pid);  // races the child's own call; either wins
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);
    CloseFd(error_pipe[1]);

    int child_errno = 0;
    ssize_t bytes;
    do {
        bytes = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes == -1 && errno == EINTR);
    CloseFd(error_pipe[0]);

    if (bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        waitpid(pid, nullptr, 0);
        close_all();
        return fail("Failed to start " + argv[0] + ": " + strerror(child_errno));
    }

    for (int fd : {stdout_pipe[0], stderr_pipe[0]}) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    Logger::Debug("Spawned ", argv[0], " as PID ", pid);
    return SpawnedProcess{pid, stdout_pipe[0], stderr_pipe[0]};
}

WaitResult Process::WaitUntil(SpawnedProcess& process, Clock::time_point deadline,
                              size_t max_output) {
    WaitResult result;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        int slice = static_cast<int>(std::max<long long>(0, std::min<long long>(remaining.count(), 50)));

        pollfd fds[2];
        nfds_t count = 0;
        if (process.stdout_fd >= 0) fds[count++] = {process.stdout_fd, POLLIN, 0};
        if (process.stderr_fd >= 0) fds[count++] = {process.stderr_fd, POLLIN, 0};

        if (count > 0) {
            int activity = poll(fds, count, slice);
            if (activity < 0 && errno != EINTR) {
                Logger::Error("poll failed for PID ", process.pid, ": ", strerror(errno));
            }
            DrainFd(process.stdout_fd, result.stdout_data, max_output);
            DrainFd(process.stderr_fd, result.stderr_data, max_output);
        } else if (slice > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(slice, 10)));
        }

        int status = 0;
        pid_t waited = waitpid(process.pid, &status, WNOHANG);
        if (waited == process.pid) {
            DrainFd(process.stdout_fd, result.stdout_data, max_output);
            DrainFd(process.stderr_fd, result.stderr_data, max_output);
            CloseStreams(process);
            FillStatus(result, status);
            return result;
        }
        if (waited == -1 && errno == ECHILD) {
            Logger::Warn("PID ", process.pid, " was reaped elsewhere; exit status unknown");
            CloseStreams(process);
            result.exited = true;
            return result;
        }

        if (Clock::now() >= deadline) return result;
    }
}

bool Process::TerminateAndReap(SpawnedProcess& process, std::chrono::milliseconds grace) {
    pid_t pid = process.pid;
    bool forced = false;

    if (!Signal(pid, SIGTERM) && errno != ESRCH) {
        Logger::Warn("SIGTERM to PID ", pid, " failed: ", strerror(errno));
    }

    auto grace_end = Clock::now() + grace;
    int status = 0;
    pid_t waited = 0;
    while ((waited = waitpid(pid, &status, WNOHANG)) == 0 && Clock::now() < grace_end) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (waited == 0) {
        forced = true;
        if (!Signal(pid, SIGKILL) && errno != ESRCH) {
            Logger::Error("SIGKILL to PID ", pid, " failed: ", strerror(errno));
        }
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }

    // Stragglers the compiler forked keep the group alive after the leader is gone.
    kill(-pid, SIGKILL);
    CloseStreams(process);
    return forced;
}

void Process::CloseStreams(SpawnedProcess& process) {
    CloseFd(process.stdout_fd);
    CloseFd(process.stderr_fd);
}

bool Process::IsAlive(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == -1 && errno != EPERM) return false;
    auto fields = StatFields(pid);
    if (fields && !fields->empty() && (*fields)[0] == "Z") return false;
    return true;
}

bool Process::Signal(pid_t pid, int signal) {
    if (pid <= 0) {
        errno = EINVAL;
        return false;
    }
    pid_t target = (getpgid(pid) == pid) ? -pid : pid;
    return kill(target, signal) == 0;
}

std::optional<double> Process::AgeSeconds(pid_t pid) {
    auto fields = StatFields(pid);
    // starttime is field 22 of stat, index 19 once pid and comm are dropped.
    if (!fields || fields->size() < 20) return std::nullopt;
    auto uptime_text = ReadProcFile("/proc/uptime");
    if (!uptime_text) return std::nullopt;

    try {
        double uptime = std::stod(*uptime_text);
        double start_ticks = std::stod((*fields)[19]);
        long ticks_per_second = sysconf(_SC_CLK_TCK);
        if (ticks_per_second <= 0) return std::nullopt;
        return std::max(0.0, uptime - start_ticks / static_cast<double>(ticks_per_second));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<std::string>> Process::CommandLine(pid_t pid) {
    auto raw = ReadProcFile("/proc/" + std::to_string(pid) + "/cmdline");
    if (!raw) return std::nullopt;

    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw->size()) {
        size_t end = raw->find('\0', start);
        if (end == std::string::npos) end = raw->size();
        args.push_back(raw->substr(start, end - start));
        start = end + 1;
    }
    return args;
}

std::vector<pid_t> Process::FindProcesses(
    const std::function<bool(const std::vector<std::string>&)>& matches) {
    std::vector<pid_t> found;
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        Logger::Warn("Cannot list /proc: ", ec.message());
        return found;
    }

    // Entries vanish while we walk; increment(ec) keeps that from throwing.
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) continue;

        pid_t pid = static_cast<pid_t>(std::stol(name));
        auto args = CommandLine(pid);
        if (args && !args->empty() && matches(*args)) found.push_back(pid);
    }
    return found;
}

} // namespace zxcompile
