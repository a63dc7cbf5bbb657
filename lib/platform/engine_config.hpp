#pragma once

#include <log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>

namespace platform {

/**
 * @brief Startup settings for the engine and the player
 *
 * Loaded from JSON; keys missing from the file keep the defaults below.
 */
struct EngineConfig {
    // Audio device
    unsigned int sampleRate = 44100;
    unsigned int channels = 2;
    unsigned int bufferFrames = 128;
    std::string device = "default";

    // Voices
    unsigned int maxPolyphony = 24;
    std::string instrument = "piano";
    std::string presetFile;

    // Output bus
    float reverbMix = 0.2f;
    float volume = 1.0f;

    // 0 seeds from std::random_device
    unsigned int randomSeed = 0;

    // Diagnostics
    bool diagnosticsEnabled = true;
    unsigned int logCapacity = 1000;
    unsigned int delayedCaptureMs = 50;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(EngineConfig,
        sampleRate,
        channels,
        bufferFrames,
        device,
        maxPolyphony,
        instrument,
        presetFile,
        reverbMix,
        volume,
        randomSeed,
        diagnosticsEnabled,
        logCapacity,
        delayedCaptureMs
    )
};

/**
 * @brief Read an EngineConfig from a JSON file
 * @param config Left unchanged unless the whole file parses
 * @return true if the file was read
 */
inline bool loadEngineConfig(const std::string& path, EngineConfig& config) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            logError("Config file %s not found", path.c_str());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config = j.get<EngineConfig>();
        logInfo("Loaded config from %s", path.c_str());
        return true;
    } catch (const std::exception& e) {
        logError("Error loading config %s: %s", path.c_str(), e.what());
        return false;
    }
}

} // namespace platform
