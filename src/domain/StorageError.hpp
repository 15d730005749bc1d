/**
 * @file StorageError.hpp
 * @brief Error type shared by the record stores and the persistence engine.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace engram::domain {

/**
 * @enum ErrorKind
 * @brief Failure categories reported by storage operations.
 */
enum class ErrorKind {
    NotFound,           ///< Id or file absent.
    Duplicate,          ///< Id already present in one of the tiers.
    Corrupt,            ///< Deserialization failed.
    IOFailure,          ///< Filesystem or SQLite error.
    ValidationFailure,  ///< Snapshot structurally invalid.
    NoConsistentState   ///< Every recovery candidate failed.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Duplicate: return "Duplicate";
        case ErrorKind::Corrupt: return "Corrupt";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::ValidationFailure: return "ValidationFailure";
        case ErrorKind::NoConsistentState: return "NoConsistentState";
        default: return "Unknown";
    }
}

/**
 * @class StorageError
 * @brief Exception carrying an ErrorKind alongside the message.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace engram::domain
