/**
 * @file EngramSession.hpp
 * @brief Long-running use of the store: records flow in while the state is snapshotted in the background.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "application/MemoryManager.hpp"
#include "application/PersistenceEngine.hpp"
#include "application/SharedState.hpp"
#include "domain/PersistedState.hpp"

namespace engram::application {

/**
 * @class EngramSession
 * @brief Owns the live PersistedState for the lifetime of a session.
 *
 * open() restores the last consistent state and starts the engine's
 * background loop; every stored record advances the state version;
 * close() stops the loop and writes a final snapshot.
 */
class EngramSession {
public:
    EngramSession(MemoryManager& manager, PersistenceEngine& engine,
                  std::chrono::milliseconds snapshotInterval);
    ~EngramSession();

    EngramSession(const EngramSession&) = delete;
    EngramSession& operator=(const EngramSession&) = delete;

    /**
     * @brief Recovers the state (initial one on a fresh install) and starts snapshotting.
     * @throws domain::StorageError (NoConsistentState) if existing snapshots are all unusable.
     */
    void open();

    /**
     * @brief Stores a record and advances the state.
     * @throws std::logic_error if the session is not open.
     */
    std::string record(const std::string& content, domain::RecordType type, float valence);

    /** @brief Stops the background loop and persists the final state. */
    domain::PersistedState close();

    bool isOpen() const { return m_open; }

    std::shared_ptr<SharedState<domain::PersistedState>> state() const { return m_state; }

private:
    MemoryManager& m_manager;
    PersistenceEngine& m_engine;
    std::chrono::milliseconds m_interval;
    std::shared_ptr<SharedState<domain::PersistedState>> m_state;
    bool m_open = false;
};

} // namespace engram::application
