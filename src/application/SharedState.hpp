/**
 * @file SharedState.hpp
 * @brief Value shared between a producer and background readers under a reader/writer lock.
 */

#pragma once

#include <shared_mutex>
#include <mutex>
#include <utility>

namespace engram::application {

/**
 * @class SharedState
 * @brief Readers take a shared lock and may run concurrently; update() is exclusive.
 */
template <typename T>
class SharedState {
public:
    SharedState() = default;
    explicit SharedState(T initial) : m_value(std::move(initial)) {}

    /** @brief Copy of the current value. */
    T read() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_value;
    }

    /** @brief Runs fn(const T&) under the shared lock and returns its result. */
    template <typename Fn>
    auto withRead(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return fn(m_value);
    }

    /** @brief Runs fn(T&) under the exclusive lock and returns its result. */
    template <typename Fn>
    auto update(Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        return fn(m_value);
    }

    void set(T value) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_value = std::move(value);
    }

private:
    mutable std::shared_mutex m_mutex;
    T m_value{};
};

} // namespace engram::application
