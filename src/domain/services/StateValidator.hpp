/**
 * @file StateValidator.hpp
 * @brief Structural integrity checks for persisted state snapshots.
 */

#pragma once

#include <string>
#include "domain/PersistedState.hpp"

namespace engram::domain::services {

struct ValidationReport {
    bool passed = true;
    std::string reason;
};

class StateValidator {
public:
    static ValidationReport validate(const PersistedState& state) {
        ValidationReport report;
        if (state.version == 0) {
            report.passed = false;
            report.reason = "Invalid state version 0";
        } else if (state.lastUpdate == 0.0) {
            report.passed = false;
            report.reason = "State has never been updated";
        } else if (state.fieldData.empty()) {
            report.passed = false;
            report.reason = "Empty field data vector";
        }
        return report;
    }
};

} // namespace engram::domain::services
