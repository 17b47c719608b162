/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for function calling against a local Ollama server.
 */

#pragma once
#include "domain/FunctionCallingService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>

namespace writher::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements FunctionCallingService using the Ollama /api/chat "tools" field.
 */
class OllamaAdapter : public domain::FunctionCallingService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred model; replaced by the best installed one if missing.
     * @param timeoutSeconds Bound on one chat request.
     */
    OllamaAdapter(const std::string& host = "localhost",
                  int port = 11434,
                  const std::string& model = "qwen2.5:7b",
                  int timeoutSeconds = 10);

    /** @see domain::FunctionCallingService::callFunctions */
    std::vector<domain::ToolCall> callFunctions(const std::string& systemPrompt,
                                                const std::string& userText,
                                                const nlohmann::json& tools) override;

    /** @see domain::FunctionCallingService::ping */
    bool ping() override;

    /** @brief Extracts tool calls from an /api/chat "message" object. */
    static std::vector<domain::ToolCall> ExtractToolCalls(const nlohmann::json& message);

    std::string model() const;

private:
    /** @brief Picks the model once Ollama answers. Returns the model to use now. */
    std::string ensureModel();
    void detectBestModel();

    OllamaClient m_client;
    mutable std::mutex m_modelMutex; ///< Guards m_model and m_modelChecked; callers run on task threads.
    std::string m_model; ///< Target model name.
    bool m_modelChecked = false;
};

} // namespace writher::infrastructure
