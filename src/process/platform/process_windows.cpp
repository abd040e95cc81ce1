#include "process/process.hpp"
#include <windows.h>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace chessan::process {

namespace {

constexpr auto READ_POLL_INTERVAL = std::chrono::milliseconds(2);

std::string last_error_message(const char* what) {
    return std::string(what) + " (error " + std::to_string(GetLastError()) + ")";
}

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    auto ext = path.extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".exe" || ext == ".bat" || ext == ".cmd" || ext == ".com";
}

} // namespace

class Process::ProcessImpl {
public:
    ProcessImpl(const std::filesystem::path& executable,
                const std::vector<std::string>& args) {
        SECURITY_ATTRIBUTES sa_attr;
        sa_attr.nLength = sizeof(SECURITY_ATTRIBUTES);
        sa_attr.bInheritHandle = TRUE;
        sa_attr.lpSecurityDescriptor = nullptr;

        if (!CreatePipe(&m_engine_stdin_read, &m_engine_stdin_write, &sa_attr, 0)) {
            throw std::runtime_error(last_error_message("Failed to create engine stdin pipe"));
        }
        if (!SetHandleInformation(m_engine_stdin_write, HANDLE_FLAG_INHERIT, 0)) {
            throw std::runtime_error(last_error_message("Failed to set handle information for stdin"));
        }

        if (!CreatePipe(&m_engine_stdout_read, &m_engine_stdout_write, &sa_attr, 0)) {
            throw std::runtime_error(last_error_message("Failed to create engine stdout pipe"));
        }
        if (!SetHandleInformation(m_engine_stdout_read, HANDLE_FLAG_INHERIT, 0)) {
            throw std::runtime_error(last_error_message("Failed to set handle information for stdout"));
        }

        STARTUPINFOW si_startup_info{};
        si_startup_info.cb = sizeof(STARTUPINFOW);
        si_startup_info.hStdError = m_engine_stdout_write;
        si_startup_info.hStdOutput = m_engine_stdout_write;
        si_startup_info.hStdInput = m_engine_stdin_read;
        si_startup_info.dwFlags |= STARTF_USESTDHANDLES;

        std::wstring w_command_line = L"\"" + executable.wstring() + L"\"";
        for (const auto& arg : args) {
            w_command_line += L" " + std::filesystem::path(arg).wstring();
        }

        if (!CreateProcessW(nullptr, &w_command_line[0], nullptr, nullptr, TRUE,
                            CREATE_NO_WINDOW, nullptr, nullptr, &si_startup_info,
                            &m_process_info)) {
            const std::string reason = last_error_message("Failed to create process");
            CloseHandle(m_engine_stdin_read);
            CloseHandle(m_engine_stdout_write);
            CloseHandle(m_engine_stdin_write);
            CloseHandle(m_engine_stdout_read);
            m_engine_stdin_write = nullptr;
            m_engine_stdout_read = nullptr;
            throw std::runtime_error("Failed to launch '" + executable.string() + "': " + reason);
        }
        m_is_running = true;

        CloseHandle(m_engine_stdin_read);
        CloseHandle(m_engine_stdout_write);
    }

    ~ProcessImpl() {
        if (m_is_running) {
            terminate();
        }
        close_handle(m_engine_stdin_write);
        close_handle(m_engine_stdout_read);
    }

    bool is_running() {
        if (!m_is_running) {
            return false;
        }
        DWORD exit_code;
        if (!GetExitCodeProcess(m_process_info.hProcess, &exit_code)) {
            return false;
        }
        return exit_code == STILL_ACTIVE;
    }

    i64 pid() const { return m_is_running ? static_cast<i64>(m_process_info.dwProcessId) : -1; }

    bool write_line(std::string_view line) {
        if (!m_engine_stdin_write) {
            return false;
        }
        std::string full_line = std::string(line) + "\n";
        DWORD bytes_written = 0;
        return WriteFile(m_engine_stdin_write, full_line.c_str(),
                         static_cast<DWORD>(full_line.length()), &bytes_written, nullptr) &&
               bytes_written == full_line.length();
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

            DWORD available = 0;
            if (!PeekNamedPipe(m_engine_stdout_read, nullptr, 0, nullptr, &available, nullptr)) {
                m_eof = true;
                if (!m_buffer.empty()) {
                    std::string line = std::move(m_buffer);
                    m_buffer.clear();
                    return line;
                }
                return std::nullopt;
            }

            if (available > 0) {
                char buffer[4096];
                DWORD to_read = available < sizeof(buffer) ? available : sizeof(buffer);
                DWORD bytes_read = 0;
                if (ReadFile(m_engine_stdout_read, buffer, to_read, &bytes_read, nullptr) &&
                    bytes_read > 0) {
                    m_buffer.append(buffer, bytes_read);
                }
                continue;
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(READ_POLL_INTERVAL);
        }
    }

    bool at_eof() const { return m_eof && m_buffer.find('\n') == std::string::npos; }

    bool wait_for_exit(std::chrono::milliseconds timeout) {
        if (!m_is_running) {
            return true;
        }
        return WaitForSingleObject(m_process_info.hProcess, static_cast<DWORD>(timeout.count())) ==
               WAIT_OBJECT_0;
    }

    void terminate() {
        close_handle(m_engine_stdin_write);
        if (m_is_running) {
            if (is_running()) {
                TerminateProcess(m_process_info.hProcess, 0);
                WaitForSingleObject(m_process_info.hProcess, INFINITE);
            }
            CloseHandle(m_process_info.hProcess);
            CloseHandle(m_process_info.hThread);
            m_is_running = false;
        }
    }

private:
    std::optional<std::string> take_buffered_line() {
        if (auto pos = m_buffer.find('\n'); pos != std::string::npos) {
            std::string line = m_buffer.substr(0, pos);
            m_buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        return std::nullopt;
    }

    static void close_handle(HANDLE& handle) {
        if (handle) {
            CloseHandle(handle);
            handle = nullptr;
        }
    }

    PROCESS_INFORMATION m_process_info{};
    HANDLE m_engine_stdin_read{nullptr}, m_engine_stdin_write{nullptr};
    HANDLE m_engine_stdout_read{nullptr}, m_engine_stdout_write{nullptr};
    std::string m_buffer;
    bool m_is_running{false};
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

    if (candidate.has_parent_path()) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> names{candidate};
    if (!candidate.has_extension()) {
        names.emplace_back(candidate.string() + ".exe");
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view search_path(path_env);
    while (!search_path.empty()) {
        auto sep = search_path.find(';');
        std::string_view dir = search_path.substr(0, sep);
        search_path = sep == std::string_view::npos ? std::string_view{}
                                                    : search_path.substr(sep + 1);
        if (dir.empty()) {
            continue;
        }
        for (const auto& name : names) {
            std::filesystem::path full = std::filesystem::path(std::string(dir)) / name;
            if (is_executable_file(full)) {
                return full;
            }
        }
    }
    return std::nullopt;
}

} // namespace chessan::process
