/**
 * @file Failure.hpp
 * @brief Failure taxonomy for the capture, transcription, dispatch and persistence paths.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace writher::domain {

/**
 * @enum FailureKind
 * @brief Every recoverable failure a session can end with.
 */
enum class FailureKind {
    DeviceUnavailable,
    Busy,
    TranscriptionFailed,
    NoSpeechDetected,
    BackendUnavailable,
    BackendTimeout,
    UnrecognizedAction,
    InjectionFailed,
    PersistenceError
};

inline const char* FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::DeviceUnavailable: return "DeviceUnavailable";
        case FailureKind::Busy: return "Busy";
        case FailureKind::TranscriptionFailed: return "TranscriptionFailed";
        case FailureKind::NoSpeechDetected: return "NoSpeechDetected";
        case FailureKind::BackendUnavailable: return "BackendUnavailable";
        case FailureKind::BackendTimeout: return "BackendTimeout";
        case FailureKind::UnrecognizedAction: return "UnrecognizedAction";
        case FailureKind::InjectionFailed: return "InjectionFailed";
        case FailureKind::PersistenceError: return "PersistenceError";
    }
    return "Unknown";
}

/**
 * @class WritherError
 * @brief Exception thrown by adapters and services; the kind decides how the session reports it.
 */
class WritherError : public std::runtime_error {
public:
    WritherError(FailureKind kind, const std::string& message, bool transient = false)
        : std::runtime_error(message), m_kind(kind), m_transient(transient) {}

    FailureKind kind() const { return m_kind; }

    /** @brief True for network-level failures that are worth one retry. */
    bool isTransient() const { return m_transient; }

private:
    FailureKind m_kind;
    bool m_transient;
};

/**
 * @class StoreCorruptedError
 * @brief Unrecoverable local storage failure. The process must not continue with it.
 */
class StoreCorruptedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace writher::domain
