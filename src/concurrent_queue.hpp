#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

// Capacity 0 means unbounded. Only try_push honours the capacity and the
// closed flag; push is reserved for producers whose volume is bounded elsewhere.
template <typename T>
class ConcurrentQueue {
public:
    ConcurrentQueue() = default;
    explicit ConcurrentQueue(u64 capacity) : m_capacity(capacity) {}

    void push(const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(value);
        m_cv.notify_one();
    }

    void push(T&& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(std::move(value));
        m_cv.notify_one();
    }

    bool try_push(T&& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || (m_capacity > 0 && m_queue.size() >= m_capacity)) {
            return false;
        }
        m_queue.push(std::move(value));
        m_cv.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop();
        return value;
    }

    std::optional<T> wait_and_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_closed; }) &&
            !m_queue.empty()) {
            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }
        return std::nullopt;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_cv.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    u64 capacity() const { return m_capacity; }

private:
    std::queue<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    u64 m_capacity{0};
    bool m_closed{false};
};
