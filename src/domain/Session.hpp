/**
 * @file Session.hpp
 * @brief Hotkey session kinds, states and the per-kind track value.
 */

#pragma once

#include <cstdint>
#include "domain/Clock.hpp"

namespace writher::domain {

enum class SessionKind { Dictation, Assistant };

enum class SessionState { Idle, Capturing, Processing };

inline const char* SessionKindToString(SessionKind kind) {
    return kind == SessionKind::Dictation ? "dictation" : "assistant";
}

inline const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Capturing: return "Capturing";
        case SessionState::Processing: return "Processing";
    }
    return "Idle";
}

/**
 * @struct Track
 * @brief Independent state machine value for one hotkey kind.
 *
 * Owned by the coordination loop. Background work only ever refers to a
 * session through its sessionId.
 */
struct Track {
    SessionKind kind;
    SessionState state = SessionState::Idle;
    std::uint64_t sessionId = 0;       ///< Id of the current (or last) session on this track.
    MonotonicPoint startedAt{};        ///< Capture start of the current session.
    bool keyHeld = false;              ///< Physical key flag, filters auto-repeat.
    std::uint64_t captureTimer = 0;    ///< Pending T_max timer, 0 when none.
    std::uint64_t processingTimer = 0; ///< Pending processing timeout, 0 when none.

    explicit Track(SessionKind k) : kind(k) {}
};

} // namespace writher::domain
