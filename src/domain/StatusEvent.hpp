/**
 * @file StatusEvent.hpp
 * @brief User-visible status updates consumed by the overlay and tray.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "domain/Failure.hpp"
#include "domain/Session.hpp"

namespace writher::domain {

enum class StatusType {
    Listening,      ///< Capture started.
    Processing,     ///< Capture stopped, transcription running.
    Idle,           ///< Track returned to rest.
    Injected,       ///< Dictated text pasted.
    NothingHeard,   ///< Empty transcript.
    TooShort,       ///< Capture below the minimum length, dropped.
    AssistantReply, ///< Batch applied; message holds the confirmation.
    ShowView,       ///< Assistant asked to open a view of the notes window.
    Failure,        ///< Session ended with a failure.
    Warning         ///< Standing warning (e.g. backend unreachable at startup).
};

inline const char* StatusTypeToString(StatusType type) {
    switch (type) {
        case StatusType::Listening: return "listening";
        case StatusType::Processing: return "processing";
        case StatusType::Idle: return "idle";
        case StatusType::Injected: return "injected";
        case StatusType::NothingHeard: return "nothing heard";
        case StatusType::TooShort: return "too short";
        case StatusType::AssistantReply: return "assistant";
        case StatusType::ShowView: return "view";
        case StatusType::Failure: return "failure";
        case StatusType::Warning: return "warning";
    }
    return "status";
}

enum class ViewKind { Notes, Agenda, Reminders };

struct StatusEvent {
    StatusType type;
    std::optional<SessionKind> kind;
    std::string message;
    std::optional<FailureKind> failure;
    std::optional<ViewKind> view;
};

using StatusListener = std::function<void(const StatusEvent&)>;

} // namespace writher::domain
