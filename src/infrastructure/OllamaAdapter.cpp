/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace writher::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model, int timeoutSeconds)
    : m_client(host, port, timeoutSeconds), m_model(model) {}

std::string OllamaAdapter::model() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

std::string OllamaAdapter::ensureModel() {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    if (!m_modelChecked) {
        detectBestModel();
    }
    return m_model;
}

// Requires m_modelMutex.
void OllamaAdapter::detectBestModel() {
    m_modelChecked = true;
    auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        m_modelChecked = false;
        return;
    }

    if (std::find(availableModels.begin(), availableModels.end(), m_model) != availableModels.end()) {
        return;
    }

    // Priority Hierarchy, all with tool support
    const std::vector<std::string> priorities = {
        m_model,
        "qwen2.5",
        "llama3.1",
        "llama3.2",
        "mistral"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    // Fallback: Pick the first available
    m_model = availableModels[0];
    std::cout << "[OllamaAdapter] Fallback model: " << m_model << std::endl;
}

bool OllamaAdapter::ping() {
    const bool reachable = m_client.isReachable();
    if (reachable) {
        ensureModel();
    }
    std::cout << "[OllamaAdapter] Ping: " << (reachable ? "ok" : "unreachable") << std::endl;
    return reachable;
}

std::vector<domain::ToolCall> OllamaAdapter::callFunctions(const std::string& systemPrompt,
                                                           const std::string& userText,
                                                           const json& tools) {
    const std::string model = ensureModel();

    json messages = json::array({
        {{"role", "system"}, {"content", systemPrompt}},
        {{"role", "user"}, {"content", userText}}
    });

    json message = m_client.chatWithTools(model, messages, tools);
    return ExtractToolCalls(message);
}

std::vector<domain::ToolCall> OllamaAdapter::ExtractToolCalls(const json& message) {
    std::vector<domain::ToolCall> calls;

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& tc : message["tool_calls"]) {
            if (!tc.contains("function") || !tc["function"].is_object()) continue;
            const auto& fn = tc["function"];
            if (!fn.contains("name") || !fn["name"].is_string()) continue;
            calls.push_back(domain::ToolCall{fn["name"].get<std::string>(), fn.value("arguments", json::object())});
        }
        if (!calls.empty()) {
            return calls;
        }
    }

    // Some models answer with the call as JSON in the content instead
    if (message.contains("content") && message["content"].is_string()) {
        const std::string content = message["content"].get<std::string>();
        json parsed = json::parse(content, nullptr, false);
        if (parsed.is_discarded()) {
            if (!content.empty()) {
                std::cout << "[OllamaAdapter] Text response: " << content << std::endl;
            }
            return calls;
        }

        auto fromObject = [&calls](const json& obj) {
            if (!obj.is_object()) return;
            std::string nameKey = obj.contains("function") ? "function" : (obj.contains("name") ? "name" : "");
            if (nameKey.empty() || !obj[nameKey].is_string()) return;
            calls.push_back(domain::ToolCall{obj[nameKey].get<std::string>(), obj.value("arguments", json::object())});
        };

        if (parsed.is_array()) {
            for (const auto& item : parsed) fromObject(item);
        } else {
            fromObject(parsed);
        }
    }
    return calls;
}

} // namespace writher::infrastructure
