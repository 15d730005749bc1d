/**
 * @file PersistedState.hpp
 * @brief Versioned state object snapshotted by the persistence engine.
 */

#pragma once
#include <cstdint>
#include <vector>
#include <chrono>

namespace engram::domain {

/**
 * @struct PersistedState
 * @brief Small numeric state owned by an external collaborator.
 */
struct PersistedState {
    uint64_t version = 0;                 ///< Monotonic; valid states start at 1.
    double lastUpdate = 0.0;              ///< Seconds since epoch of the last change.
    std::vector<double> fieldData;        ///< Primary vector, must be non-empty.
    std::vector<double> cognitiveTensor;
    std::vector<double> memoryEmbeddings;
    double satisfaction = 0.0;
    double affirmation = 0.0;

    /** @brief Fresh state at version 1 with zeroed vectors. */
    static PersistedState Initial() {
        PersistedState state;
        state.version = 1;
        state.lastUpdate = CurrentTime();
        state.fieldData.assign(64, 0.0);
        state.cognitiveTensor.assign(64, 0.0);
        state.memoryEmbeddings.assign(32, 0.0);
        state.satisfaction = 1.0;
        state.affirmation = 0.5;
        return state;
    }

    /** @brief Marks the state as changed: bumps version and timestamp. */
    void touch() {
        ++version;
        lastUpdate = CurrentTime();
    }

    static double CurrentTime() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
    }
};

} // namespace engram::domain
