#pragma once

#include "engine/engine_session.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#ifndef CHESSAN_STUB_ENGINE
#error "CHESSAN_STUB_ENGINE must point at the stub engine binary"
#endif

namespace chessan::test {

inline std::filesystem::path stub_engine_path() {
    return CHESSAN_STUB_ENGINE;
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("chessan_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

// Executable wrapper that execs the stub engine with fixed arguments, so a
// plain executable path selects the stub's behaviour.
inline std::filesystem::path write_stub_script(const TempDir& dir, const std::string& name,
                                               const std::vector<std::string>& args = {}) {
    auto script = dir.path() / name;
    std::ofstream out(script);
    out << "#!/bin/sh\nexec " << shell_quote(stub_engine_path().string());
    for (const auto& arg : args) {
        out << " " << shell_quote(arg);
    }
    out << "\n";
    out.close();
    chmod(script.c_str(), 0755);
    return script;
}

inline engine::SessionConfig fast_config() {
    engine::SessionConfig config;
    config.handshake_timeout = std::chrono::milliseconds(3000);
    config.poll_interval = std::chrono::milliseconds(20);
    config.sync_timeout = std::chrono::milliseconds(1000);
    config.watchdog_factor = 2;
    config.watchdog_margin = std::chrono::milliseconds(2000);
    config.quit_grace = std::chrono::milliseconds(500);
    return config;
}

inline std::optional<engine::SessionEvent> next_event(
    engine::EngineSession& session,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(15000)) {
    return session.wait_event(timeout);
}

template <typename Event>
Event expect_event(engine::EngineSession& session) {
    auto event = next_event(session);
    if (!event) {
        ADD_FAILURE() << "timed out waiting for a session event";
        return Event{};
    }
    if (!std::holds_alternative<Event>(*event)) {
        std::string detail = "unexpected event index " + std::to_string(event->index());
        if (const auto* failed = std::get_if<engine::ConnectFailed>(&*event)) {
            detail += ": " + failed->reason;
        } else if (const auto* error = std::get_if<engine::OperationFailed>(&*event)) {
            detail += ": " + error->reason;
        }
        ADD_FAILURE() << detail;
        return Event{};
    }
    return std::get<Event>(*event);
}

inline std::vector<std::filesystem::path> files_in(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    return files;
}

} // namespace chessan::test
