#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include "domain/Failure.hpp"

namespace writher::infrastructure {

using json = nlohmann::json;
using domain::FailureKind;
using domain::WritherError;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kProbeTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

json OllamaClient::chatWithTools(const std::string& model,
                                 const json& messages,
                                 const json& tools) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kProbeTimeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"tools", tools},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        const auto error = res.error();
        std::cerr << "[OllamaClient] Chat request failed: " << httplib::to_string(error) << std::endl;
        if (error == httplib::Error::Read) {
            throw WritherError(FailureKind::BackendTimeout,
                               "No answer from Ollama within " + std::to_string(m_timeoutSeconds) + " s");
        }
        throw WritherError(FailureKind::BackendUnavailable,
                           "Ollama not reachable at " + m_host + ":" + std::to_string(m_port), true);
    }

    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw WritherError(FailureKind::BackendUnavailable,
                           "Ollama answered HTTP " + std::to_string(res->status), res->status >= 500);
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.contains("message") || !body["message"].is_object()) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << res->body << std::endl;
        throw WritherError(FailureKind::BackendUnavailable, "Malformed answer from Ollama");
    }
    return body["message"];
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kProbeTimeoutSeconds);
    cli.set_read_timeout(kProbeTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        json body = json::parse(res->body, nullptr, false);
        if (!body.is_discarded() && body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name") && item["name"].is_string()) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    }
    return models;
}

bool OllamaClient::isReachable() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kProbeTimeoutSeconds);
    cli.set_read_timeout(kProbeTimeoutSeconds);

    auto res = cli.Get("/api/tags");
    return res && res->status == 200;
}

} // namespace writher::infrastructure
