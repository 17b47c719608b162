/**
 * @file ProcessingOutcome.hpp
 * @brief Result of a session's background processing, delivered back to the coordination loop.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "domain/Failure.hpp"

namespace writher::application {

/**
 * @struct ProcessingOutcome
 * @brief Completion event of one session.
 *
 * `finalize` runs on the coordination loop, and only while the session is
 * still the current one of its track. It applies store mutations and emits
 * the final status. It may throw WritherError.
 */
struct ProcessingOutcome {
    std::string summary;                  ///< Short description for the log.
    std::optional<domain::FailureKind> failure;
    std::function<void()> finalize;
};

/** @brief Called from any thread to hand the outcome back to the loop. */
using CompletionCallback = std::function<void(ProcessingOutcome)>;

} // namespace writher::application
