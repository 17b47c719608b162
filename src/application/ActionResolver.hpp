/**
 * @file ActionResolver.hpp
 * @brief Maps a transcript to a validated batch of typed actions.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "application/MessageCatalog.hpp"
#include "domain/Action.hpp"
#include "domain/FunctionCallingService.hpp"

namespace writher::application {

/**
 * @class ActionResolver
 * @brief Wraps the function-calling backend with strict schema validation.
 *
 * Either every tool call of a response converts into a typed Action or the
 * whole response is rejected with WritherError(UnrecognizedAction).
 */
class ActionResolver {
public:
    ActionResolver(std::shared_ptr<domain::FunctionCallingService> backend,
                   const MessageCatalog& messages,
                   std::chrono::minutes pastTolerance = std::chrono::minutes(5));

    /**
     * @brief Asks the backend for the actions matching `transcript`.
     *
     * A transient backend failure is retried once; the second failure is
     * reported as BackendUnavailable.
     * @throws WritherError (UnrecognizedAction, BackendUnavailable, BackendTimeout).
     */
    domain::ActionBatch resolve(const std::string& transcript, domain::Instant now);

    /**
     * @brief Converts one raw tool call into a typed Action.
     * @throws WritherError(UnrecognizedAction) on unknown names, missing or
     *         mistyped fields, non-absolute times, or times too far in the past.
     */
    domain::Action toAction(const domain::ToolCall& call, domain::Instant now) const;

private:
    std::vector<domain::ToolCall> callBackend(const std::string& transcript, domain::Instant now);

    std::shared_ptr<domain::FunctionCallingService> m_backend;
    const MessageCatalog& m_messages;
    std::chrono::minutes m_pastTolerance;
    nlohmann::json m_tools;
};

} // namespace writher::application
