/**
 * @file PersistenceEngine.cpp
 * @brief Implementation of PersistenceEngine.
 */

#include "application/PersistenceEngine.hpp"
#include "domain/StorageError.hpp"
#include "domain/services/StateValidator.hpp"
#include <iostream>
#include <stdexcept>

namespace engram::application {

using domain::ErrorKind;
using domain::PersistedState;
using domain::StorageError;

PersistenceEngine::PersistenceEngine(std::filesystem::path root, size_t retention)
    : m_store(std::move(root), retention), m_running(false) {}

PersistenceEngine::~PersistenceEngine() {
    stop();
}

void PersistenceEngine::persist(const PersistedState& state) {
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        m_store.write(state);
    }

    auto report = domain::services::StateValidator::validate(state);
    if (!report.passed) {
        throw StorageError(ErrorKind::ValidationFailure, "Persisted invalid state: " + report.reason);
    }
}

PersistedState PersistenceEngine::recover() {
    for (const auto& candidate : m_store.recoveryCandidates()) {
        try {
            PersistedState state = m_store.read(candidate);
            auto report = domain::services::StateValidator::validate(state);
            if (report.passed) {
                std::cout << "[PersistenceEngine] Recovered state v" << state.version
                          << " from " << candidate.string() << std::endl;
                return state;
            }
            std::cerr << "[PersistenceEngine] Skipping " << candidate.string()
                      << ": " << report.reason << std::endl;
        } catch (const StorageError& e) {
            std::cerr << "[PersistenceEngine] Skipping " << candidate.string()
                      << " (" << domain::ErrorKindToString(e.kind()) << "): " << e.what() << std::endl;
        }
    }
    throw StorageError(ErrorKind::NoConsistentState, "No consistent state found in primary, backup or archive");
}

PersistedState PersistenceEngine::recoverOrInitial() {
    if (m_store.empty()) {
        std::cout << "[PersistenceEngine] No snapshots yet, starting from the initial state" << std::endl;
        return PersistedState::Initial();
    }
    return recover();
}

void PersistenceEngine::startBackgroundLoop(std::shared_ptr<SharedState<PersistedState>> state,
                                            std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        throw std::logic_error("Background persistence loop already running");
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_running = true;
    m_worker = std::thread(&PersistenceEngine::workerLoop, this, std::move(state), interval);
}

void PersistenceEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceEngine::workerLoop(std::shared_ptr<SharedState<PersistedState>> state,
                                   std::chrono::milliseconds interval) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, interval, [this] { return !m_running; });
            if (!m_running) {
                return; // Exit point
            }
        }

        // Snapshot outside the worker lock
        PersistedState snapshot = state->read();
        try {
            persist(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceEngine] Background persist failed: " << e.what() << std::endl;
        }
    }
}

} // namespace engram::application
