/**
 * @file PersistenceEngine.hpp
 * @brief Crash-resistant snapshots of PersistedState with ordered recovery.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include "application/SharedState.hpp"
#include "domain/PersistedState.hpp"
#include "infrastructure/SnapshotStore.hpp"

namespace engram::application {

/**
 * @class PersistenceEngine
 * @brief Writes snapshots to primary, backup and dated archive locations and
 * restores the first consistent one.
 *
 * Optionally runs a background thread that snapshots a SharedState at a fixed
 * interval. Independent of the record tiers.
 */
class PersistenceEngine {
public:
    /**
     * @param root Directory that holds the snapshot files.
     * @param retention Number of dated snapshots kept after each write.
     */
    PersistenceEngine(std::filesystem::path root, size_t retention = 100);
    ~PersistenceEngine();

    PersistenceEngine(const PersistenceEngine&) = delete;
    PersistenceEngine& operator=(const PersistenceEngine&) = delete;

    /**
     * @brief Writes the state to every location, then validates it.
     * @throws domain::StorageError IOFailure if a write fails,
     *         ValidationFailure if the state is invalid (files are still written).
     */
    void persist(const domain::PersistedState& state);

    /**
     * @brief Tries primary, backup, then dated snapshots newest first.
     * @return The first snapshot that parses and validates.
     * @throws domain::StorageError (NoConsistentState) when every candidate fails.
     */
    domain::PersistedState recover();

    /**
     * @brief recover(), or PersistedState::Initial() when nothing was ever written.
     * @throws domain::StorageError (NoConsistentState) if snapshots exist but none is usable.
     */
    domain::PersistedState recoverOrInitial();

    /**
     * @brief Starts the background snapshot thread.
     * @throws std::logic_error if the loop is already running.
     */
    void startBackgroundLoop(std::shared_ptr<SharedState<domain::PersistedState>> state,
                             std::chrono::milliseconds interval);

    /** @brief Wakes and joins the background thread. Safe to call repeatedly. */
    void stop();

    bool isRunning() const { return m_running; }

    const infrastructure::SnapshotStore& store() const { return m_store; }

private:
    void workerLoop(std::shared_ptr<SharedState<domain::PersistedState>> state,
                    std::chrono::milliseconds interval);

    infrastructure::SnapshotStore m_store;
    std::mutex m_writeMutex;

    // Worker Control
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace engram::application
