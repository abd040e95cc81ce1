#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

namespace chessan::core {

// Line-oriented text log shared by the UI thread and the engine worker.
// A logger that was never opened swallows everything.
class Logger {
public:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool open(const std::filesystem::path& path);
    void close();
    bool is_enabled() const;

    void write(std::string_view tag, std::string_view text);

private:
    std::ofstream m_file;
    mutable std::mutex m_mutex;
};

} // namespace chessan::core
