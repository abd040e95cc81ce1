#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessan::process {

// Owns one child process with piped stdin and stdout (stderr is merged into
// stdout). Launch failures throw std::runtime_error with the OS reason.
class Process {
public:
    Process(const std::filesystem::path& executable, const std::vector<std::string>& args);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    bool is_running() const;
    i64 pid() const;

    bool write_line(std::string_view line);

    // Next complete line without its terminator, or nullopt once `timeout`
    // elapses. A zero timeout only drains what is already buffered.
    std::optional<std::string> read_line(std::chrono::milliseconds timeout);
    bool at_eof() const;

    bool wait_for_exit(std::chrono::milliseconds timeout);
    void terminate();

private:
    class ProcessImpl;
    std::unique_ptr<ProcessImpl> p_impl;
};

// Accepts a path naming an executable regular file, or a bare command found
// on PATH. A value that names an existing but non-executable file is rejected
// without falling back to PATH.
std::optional<std::filesystem::path> resolve_executable(std::string_view user_value);

} // namespace chessan::process
