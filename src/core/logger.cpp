#include "core/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

namespace chessan::core {

namespace {

void write_timestamp(std::ostream& out) {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << std::setfill(' ');
}

} // namespace

Logger::~Logger() {
    close();
}

bool Logger::open(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
    m_file.open(path, std::ios::out | std::ios::trunc);
    return m_file.is_open();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

bool Logger::is_enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_file.is_open();
}

void Logger::write(std::string_view tag, std::string_view text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open()) {
        return;
    }
    write_timestamp(m_file);
    m_file << " [" << tag << "] " << text << std::endl;
}

} // namespace chessan::core
