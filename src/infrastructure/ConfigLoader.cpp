/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace writher::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ClampPositive(int& value, int fallback, const char* key) {
    if (value <= 0) {
        std::cerr << "[ConfigLoader] '" << key << "' must be positive, using " << fallback << std::endl;
        value = fallback;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings.json at " << configPath << ", using defaults." << std::endl;
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return config;
    }

    ReadKey(j, "language", config.language);
    if (j.contains("hotkeys") && j["hotkeys"].is_object()) {
        ReadKey(j["hotkeys"], "dictation", config.dictationKey);
        ReadKey(j["hotkeys"], "assistant", config.assistantKey);
    }
    ReadKey(j, "model_path", config.modelPath);
    if (j.contains("ollama") && j["ollama"].is_object()) {
        ReadKey(j["ollama"], "host", config.ollamaHost);
        ReadKey(j["ollama"], "port", config.ollamaPort);
        ReadKey(j["ollama"], "model", config.ollamaModel);
    }
    ReadKey(j, "sample_rate", config.sampleRate);
    ReadKey(j, "max_record_seconds", config.maxRecordSeconds);
    ReadKey(j, "processing_timeout_seconds", config.processingTimeoutSeconds);
    ReadKey(j, "sweep_interval_seconds", config.sweepIntervalSeconds);
    ReadKey(j, "appointment_remind_minutes", config.appointmentRemindMinutes);
    ReadKey(j, "past_tolerance_minutes", config.pastToleranceMinutes);
    ReadKey(j, "min_record_ms", config.minRecordMs);
    ReadKey(j, "hold_to_record", config.holdToRecord);
    ReadKey(j, "backend_timeout_seconds", config.backendTimeoutSeconds);

    const AppConfig defaults;
    ClampPositive(config.sampleRate, defaults.sampleRate, "sample_rate");
    ClampPositive(config.maxRecordSeconds, defaults.maxRecordSeconds, "max_record_seconds");
    ClampPositive(config.processingTimeoutSeconds, defaults.processingTimeoutSeconds, "processing_timeout_seconds");
    ClampPositive(config.sweepIntervalSeconds, defaults.sweepIntervalSeconds, "sweep_interval_seconds");
    ClampPositive(config.backendTimeoutSeconds, defaults.backendTimeoutSeconds, "backend_timeout_seconds");
    if (config.appointmentRemindMinutes < 0) config.appointmentRemindMinutes = defaults.appointmentRemindMinutes;
    if (config.pastToleranceMinutes < 0) config.pastToleranceMinutes = defaults.pastToleranceMinutes;
    if (config.minRecordMs < 0) config.minRecordMs = defaults.minRecordMs;

    return config;
}

bool ConfigLoader::Save(const std::filesystem::path& configPath, const AppConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve keys this version does not know
    if (std::filesystem::exists(configPath)) {
        std::ifstream f(configPath);
        nlohmann::json existing = nlohmann::json::parse(f, nullptr, false);
        if (existing.is_object()) {
            j = existing;
        } else {
            std::cerr << "[ConfigLoader] Existing settings.json is not valid JSON, overwriting." << std::endl;
        }
    }

    j["language"] = config.language;
    j["hotkeys"] = {{"dictation", config.dictationKey}, {"assistant", config.assistantKey}};
    j["model_path"] = config.modelPath;
    j["ollama"] = {{"host", config.ollamaHost}, {"port", config.ollamaPort}, {"model", config.ollamaModel}};
    j["sample_rate"] = config.sampleRate;
    j["max_record_seconds"] = config.maxRecordSeconds;
    j["processing_timeout_seconds"] = config.processingTimeoutSeconds;
    j["sweep_interval_seconds"] = config.sweepIntervalSeconds;
    j["appointment_remind_minutes"] = config.appointmentRemindMinutes;
    j["past_tolerance_minutes"] = config.pastToleranceMinutes;
    j["min_record_ms"] = config.minRecordMs;
    j["hold_to_record"] = config.holdToRecord;
    j["backend_timeout_seconds"] = config.backendTimeoutSeconds;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return f.good();
}

void ConfigLoader::ApplyStoreOverrides(AppConfig& config, domain::Store& store) {
    if (auto hold = store.getSetting("hold_to_record")) {
        config.holdToRecord = (*hold != "0");
    }
    if (auto seconds = store.getSetting("max_record_seconds")) {
        try {
            const int value = std::stoi(*seconds);
            if (value > 0) {
                config.maxRecordSeconds = value;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Ignoring stored max_record_seconds '" << *seconds << "': " << e.what() << std::endl;
        }
    }
}

} // namespace writher::infrastructure
