/**
 * @file EngramSession.cpp
 * @brief Implementation of EngramSession.
 */

#include "application/EngramSession.hpp"
#include <iostream>
#include <stdexcept>

namespace engram::application {

using domain::PersistedState;

EngramSession::EngramSession(MemoryManager& manager, PersistenceEngine& engine,
                             std::chrono::milliseconds snapshotInterval)
    : m_manager(manager), m_engine(engine), m_interval(snapshotInterval) {}

EngramSession::~EngramSession() {
    if (m_open) {
        // Only close() writes the final snapshot
        m_engine.stop();
    }
}

void EngramSession::open() {
    if (m_open) {
        return;
    }
    m_state = std::make_shared<SharedState<PersistedState>>(m_engine.recoverOrInitial());
    m_engine.startBackgroundLoop(m_state, m_interval);
    m_open = true;
    std::cout << "[EngramSession] Opened at state v" << m_state->read().version
              << ", snapshot every " << m_interval.count() << " ms" << std::endl;
}

std::string EngramSession::record(const std::string& content, domain::RecordType type, float valence) {
    if (!m_open) {
        throw std::logic_error("Session is not open");
    }
    std::string id = m_manager.add(content, type, valence);
    m_state->update([](PersistedState& s) { s.touch(); });
    return id;
}

PersistedState EngramSession::close() {
    if (!m_open) {
        throw std::logic_error("Session is not open");
    }
    m_engine.stop();
    m_open = false;

    PersistedState finalState = m_state->read();
    m_engine.persist(finalState);
    std::cout << "[EngramSession] Closed at state v" << finalState.version << std::endl;
    return finalState;
}

} // namespace engram::application
