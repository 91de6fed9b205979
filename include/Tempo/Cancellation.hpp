// =================================================================
// include/Tempo/Cancellation.hpp
// =================================================================
// Cooperative cancellation shared between a caller and blocking calls.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace Tempo {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t next_id = 1;
};

} // namespace detail

/**
 * @brief Scoped callback registration, unregisters on destruction
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
        : m_state(std::move(state)), m_id(id) {}
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : m_state(std::move(other.m_state)), m_id(other.m_id) { other.m_id = 0; }
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    void reset();

    std::shared_ptr<detail::CancellationState> m_state;
    uint64_t m_id = 0;
};

/**
 * @brief Read side of a cancellation source
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const { return m_state && m_state->cancelled.load(); }

    bool canBeCancelled() const { return static_cast<bool>(m_state); }

    /**
     * @brief Run a callback when the token is cancelled
     *
     * Runs the callback immediately when the token is already cancelled.
     * Callbacks run on the thread that calls CancellationSource::cancel().
     *
     * @param callback Function to invoke, must not throw
     * @return Registration that removes the callback when destroyed
     */
    CancellationRegistration onCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

/**
 * @brief Owner side that triggers cancellation
 */
class CancellationSource {
public:
    CancellationSource() : m_state(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(m_state); }

    /**
     * @brief Cancel all tokens handed out by this source
     *
     * Idempotent. Registered callbacks run once, outside the internal lock.
     */
    void cancel();

    bool isCancelled() const { return m_state->cancelled.load(); }

private:
    std::shared_ptr<detail::CancellationState> m_state;
};

} // namespace Tempo
