#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"

namespace sonar {
namespace process {

namespace {

bool is_executable_file(const std::string &path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// Reap pid, polling with WNOHANG until timeout_ms elapses
bool wait_for_exit(pid_t pid, int timeout_ms, int &status) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            return errno == ECHILD;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace

std::optional<std::string> ProcessRunner::find_executable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? std::optional<std::string>(name) : std::nullopt;
    }

    const char *path_env = std::getenv("PATH");
    std::istringstream dirs(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool ProcessRunner::run(const std::string &executable, const std::vector<std::string> &args,
                        std::chrono::milliseconds timeout, ProcessOutput &output, std::string &error) {
    auto resolved = find_executable(executable);
    if (!resolved) {
        error = "Executable not found: " + executable;
        return false;
    }

    // Close-on-exec so helpers started by concurrent scans never hold each other's pipe ends;
    // dup2 clears the flag on the child's stdout
    int stdout_pipe[2];
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error = "Failed to create stdout pipe";
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = "Fork failed";
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }

        std::vector<char *> argv;
        argv.push_back(const_cast<char *>(resolved->c_str()));
        for (const auto &arg : args) {
            argv.push_back(const_cast<char *>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::execv(resolved->c_str(), argv.data());
        _exit(127);
    }

    // Parent process
    ::close(stdout_pipe[1]);
    const int read_fd = stdout_pipe[0];
    LOG_DEBUG("[Process] Started " << *resolved << " (PID=" << pid << ")");

    output = ProcessOutput{};
    const auto until = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    bool eof = false;

    while (!eof) {
        auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            output.timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(
            std::min<long long>(50, std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count() + 1));

        pollfd pfd{};
        pfd.fd = read_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(read_fd, buf, sizeof(buf));
        if (n > 0) {
            if (output.stdout_data.size() < kMaxOutputBytes) {
                output.stdout_data.append(buf, static_cast<size_t>(n));
            }
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }
    ::close(read_fd);

    int status = 0;
    if (output.timed_out || !wait_for_exit(pid, eof ? 2000 : 0, status)) {
        LOG_WARN("[Process] " << executable << " exceeded " << timeout.count() << "ms - forcing termination");
        ::kill(pid, SIGKILL);
        wait_for_exit(pid, 500, status);
        output.timed_out = true;
        error = "Process timed out: " + executable;
        return false;
    }

    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return true;
}

}  // namespace process
}  // namespace sonar
