#include "process/process.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace chessan::process {

namespace {

constexpr auto KILL_GRACE = std::chrono::milliseconds(500);
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(5);

std::once_flag g_sigpipe_once;

void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool is_executable_file(const std::filesystem::path& path) {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

} // namespace

class Process::ProcessImpl {
public:
    ProcessImpl(const std::filesystem::path& executable,
                const std::vector<std::string>& args) {
        ignore_sigpipe();

        int stdin_pipe[2]{-1, -1};
        int stdout_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        if (pipe(stdin_pipe) < 0) {
            throw std::runtime_error(errno_message("Pipe creation failed"));
        }
        if (pipe(stdout_pipe) < 0) {
            close_fd(stdin_pipe[0]);
            close_fd(stdin_pipe[1]);
            throw std::runtime_error(errno_message("Pipe creation failed"));
        }
        if (pipe2(status_pipe, O_CLOEXEC) < 0) {
            for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]}) {
                close(fd);
            }
            throw std::runtime_error(errno_message("Pipe creation failed"));
        }

        std::vector<char*> c_args;
        c_args.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        m_pid = fork();
        if (m_pid < 0) {
            const std::string reason = errno_message("Fork failed");
            for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                           status_pipe[0], status_pipe[1]}) {
                close(fd);
            }
            throw std::runtime_error(reason);
        }

        if (m_pid == 0) {
            dup2(stdin_pipe[0], STDIN_FILENO);
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stdout_pipe[1], STDERR_FILENO);

            close(stdin_pipe[0]);
            close(stdin_pipe[1]);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            close(status_pipe[0]);

            execvp(executable.c_str(), c_args.data());

            // Only reached when exec failed: report errno to the parent.
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        close(status_pipe[1]);
        m_stdin_write_fd = stdin_pipe[1];
        m_stdout_read_fd = stdout_pipe[0];

        int child_errno = 0;
        ssize_t n;
        do {
            n = read(status_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status;
            waitpid(m_pid, &status, 0);
            m_pid = -1;
            close_fd(m_stdin_write_fd);
            close_fd(m_stdout_read_fd);
            throw std::runtime_error("Failed to launch '" + executable.string() +
                                     "': " + std::strerror(child_errno));
        }
    }

    ~ProcessImpl() {
        if (m_pid > 0) {
            terminate();
        }
        close_fd(m_stdin_write_fd);
        close_fd(m_stdout_read_fd);
    }

    bool is_running() {
        if (m_pid <= 0) {
            return false;
        }
        int status;
        pid_t result = waitpid(m_pid, &status, WNOHANG);
        if (result == m_pid) {
            m_pid = -1;
            return false;
        }
        return result == 0;
    }

    i64 pid() const { return m_pid; }

    bool write_line(std::string_view line) {
        if (m_stdin_write_fd < 0) {
            return false;
        }
        std::string full_line = std::string(line) + "\n";
        const char* data = full_line.c_str();
        u64 remaining = full_line.length();
        while (remaining > 0) {
            ssize_t bytes_written = write(m_stdin_write_fd, data, remaining);
            if (bytes_written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data += bytes_written;
            remaining -= static_cast<u64>(bytes_written);
        }
        return true;
    }

    std::optional<std::string> read_line(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (auto line = take_buffered_line()) {
                return line;
            }
            if (m_eof) {
                return std::nullopt;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds(0);
            }

            struct pollfd pfd = {m_stdout_read_fd, POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready <= 0) {
                return std::nullopt;
            }

            char buffer[4096];
            ssize_t bytes_read = read(m_stdout_read_fd, buffer, sizeof(buffer));
            if (bytes_read > 0) {
                m_buffer.append(buffer, static_cast<u64>(bytes_read));
            } else if (bytes_read == 0 || errno != EINTR) {
                m_eof = true;
                // A final unterminated line is still a line.
                if (!m_buffer.empty()) {
                    std::string line = std::move(m_buffer);
                    m_buffer.clear();
                    strip_carriage_return(line);
                    return line;
                }
            }
        }
    }

    bool at_eof() const { return m_eof && m_buffer.find('\n') == std::string::npos; }

    bool wait_for_exit(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (is_running()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }
        return true;
    }

    void terminate() {
        close_fd(m_stdin_write_fd);
        if (m_pid > 0) {
            kill(m_pid, SIGTERM);
            if (!wait_for_exit(KILL_GRACE) && m_pid > 0) {
                kill(m_pid, SIGKILL);
                int status;
                waitpid(m_pid, &status, 0);
            }
            m_pid = -1;
        }
    }

private:
    std::optional<std::string> take_buffered_line() {
        if (auto pos = m_buffer.find('\n'); pos != std::string::npos) {
            std::string line = m_buffer.substr(0, pos);
            m_buffer.erase(0, pos + 1);
            strip_carriage_return(line);
            return line;
        }
        return std::nullopt;
    }

    static void strip_carriage_return(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }

    pid_t m_pid{-1};
    int m_stdin_write_fd{-1};
    int m_stdout_read_fd{-1};
    std::string m_buffer;
    bool m_eof{false};
};

Process::Process(const std::filesystem::path& executable,
                 const std::vector<std::string>& args)
        : p_impl(std::make_unique<ProcessImpl>(executable, args)) {}
Process::~Process() = default;
Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

bool Process::is_running() const { return p_impl->is_running(); }
i64 Process::pid() const { return p_impl->pid(); }
bool Process::write_line(std::string_view line) { return p_impl->write_line(line); }
bool Process::at_eof() const { return p_impl->at_eof(); }
bool Process::wait_for_exit(std::chrono::milliseconds timeout) {
    return p_impl->wait_for_exit(timeout);
}
void Process::terminate() { p_impl->terminate(); }

std::optional<std::string> Process::read_line(std::chrono::milliseconds timeout) {
    return p_impl->read_line(timeout);
}

std::optional<std::filesystem::path> resolve_executable(std::string_view user_value) {
    if (user_value.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    const std::filesystem::path candidate{std::string(user_value)};
    if (std::filesystem::exists(candidate, ec)) {
        if (is_executable_file(candidate)) {
            return std::filesystem::absolute(candidate, ec);
        }
        return std::nullopt;
    }

    if (user_value.find('/') != std::string_view::npos) {
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view search_path(path_env);
    while (!search_path.empty()) {
        auto sep = search_path.find(':');
        std::string_view dir = search_path.substr(0, sep);
        search_path = sep == std::string_view::npos ? std::string_view{}
                                                    : search_path.substr(sep + 1);
        if (dir.empty()) {
            dir = ".";
        }
        std::filesystem::path full = std::filesystem::path(std::string(dir)) / candidate;
        if (is_executable_file(full)) {
            return full;
        }
    }
    return std::nullopt;
}

} // namespace chessan::process
