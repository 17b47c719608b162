/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace writher::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutSeconds = 10);

    /**
     * @brief Sends a non-streaming POST to /api/chat with a tool schema.
     * @return The "message" object of the response.
     * @throws WritherError(BackendUnavailable, transient) when the server cannot be reached
     *         or answers 5xx, WritherError(BackendTimeout) when no answer arrives in time,
     *         WritherError(BackendUnavailable) for any other malformed answer.
     */
    nlohmann::json chatWithTools(const std::string& model,
                                 const nlohmann::json& messages,
                                 const nlohmann::json& tools);

    /** @brief Fetches available models from /api/tags. Empty when unreachable. */
    std::vector<std::string> getAvailableModels();

    /** @brief True when /api/tags answers 200. */
    bool isReachable();

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace writher::infrastructure
