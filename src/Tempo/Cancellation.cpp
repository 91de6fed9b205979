// =================================================================
// src/Tempo/Cancellation.cpp
// =================================================================
// Implementation for cooperative cancellation.

#include "Tempo/Cancellation.hpp"
#include <vector>

namespace Tempo {

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        m_state = std::move(other.m_state);
        m_id = other.m_id;
        other.m_id = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (m_state && m_id != 0) {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callbacks.erase(m_id);
    }
    m_state.reset();
    m_id = 0;
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!m_state) {
        return CancellationRegistration();
    }

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->cancelled.load()) {
            uint64_t id = m_state->next_id++;
            m_state->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(m_state, id);
        }
    }

    callback();
    return CancellationRegistration();
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->cancelled.exchange(true)) {
            return;
        }
        for (auto& [id, callback] : m_state->callbacks) {
            to_run.push_back(std::move(callback));
        }
        m_state->callbacks.clear();
    }

    for (auto& callback : to_run) {
        callback();
    }
}

} // namespace Tempo
