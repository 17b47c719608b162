/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Every key is optional; missing or mistyped keys keep their defaults.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/Store.hpp"

namespace writher::infrastructure {

/**
 * @struct AppConfig
 * @brief Runtime configuration with defaults for every key.
 */
struct AppConfig {
    std::string language = "en";
    std::string dictationKey = "right_alt";   ///< AltGr on most layouts.
    std::string assistantKey = "right_ctrl";
    std::string modelPath;                    ///< Empty: <data>/models/ggml-base.bin.
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";
    int sampleRate = 16000;
    int maxRecordSeconds = 120;
    int processingTimeoutSeconds = 60;
    int sweepIntervalSeconds = 30;
    int appointmentRemindMinutes = 15;
    int pastToleranceMinutes = 5;
    int minRecordMs = 500;
    bool holdToRecord = true;
    int backendTimeoutSeconds = 20;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. A missing file yields the defaults.
     * @param configPath Absolute path to settings.json.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Writes every key to settings.json, preserving unknown keys. */
    static bool Save(const std::filesystem::path& configPath, const AppConfig& config);

    /**
     * @brief Applies the values the settings window keeps in the store
     *        ("hold_to_record", "max_record_seconds").
     */
    static void ApplyStoreOverrides(AppConfig& config, domain::Store& store);
};

} // namespace writher::infrastructure
