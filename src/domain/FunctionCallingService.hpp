/**
 * @file FunctionCallingService.hpp
 * @brief Interface for the LLM function-calling backend.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace writher::domain {

/**
 * @struct ToolCall
 * @brief One function invocation returned by the backend, still untyped.
 */
struct ToolCall {
    std::string name;
    nlohmann::json arguments; ///< Object, or a string holding a JSON object.
};

/**
 * @class FunctionCallingService
 * @brief Single-turn prompt + tool schema in, ordered tool calls out.
 */
class FunctionCallingService {
public:
    virtual ~FunctionCallingService() = default;

    /**
     * @brief Asks the backend which functions to call for the user's request.
     * @param systemPrompt Instructions including the current date and time.
     * @param userText The transcript.
     * @param tools Tool schema in the OpenAI/Ollama "tools" format.
     * @return Tool calls in the order the backend returned them (may be empty).
     * @throws WritherError(BackendUnavailable, transient) on connection failures,
     *         WritherError(BackendTimeout) when the call exceeds its timeout.
     */
    virtual std::vector<ToolCall> callFunctions(const std::string& systemPrompt,
                                                const std::string& userText,
                                                const nlohmann::json& tools) = 0;

    /** @brief Quick connectivity check used once at startup. */
    virtual bool ping() = 0;
};

} // namespace writher::domain
