#pragma once

#include "preset_storage.hpp"
#include <preset.hpp>
#include <log.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace features {

/**
 * @brief Stores presets as a JSON array in a single file
 *
 * Every array element is a preset object; missing keys take the preset
 * defaults. A file that fails to parse is rejected as a whole.
 */
class FilesystemPresetStorage : public PresetStorage {
public:
    explicit FilesystemPresetStorage(std::string filePath = "presets.json")
        : filePath_(std::move(filePath)) {}

    bool loadPresets(presets::PresetCatalog& catalog) override {
        std::vector<presets::Preset> loaded;
        try {
            std::ifstream file(filePath_);
            if (!file.is_open()) {
                logInfo("Preset file %s not found, using built-in presets", filePath_.c_str());
                return false;
            }

            nlohmann::json j;
            file >> j;
            if (!j.is_array()) {
                logError("Preset file %s must contain a JSON array", filePath_.c_str());
                return false;
            }
            loaded = j.get<std::vector<presets::Preset>>();
        } catch (const std::exception& e) {
            logError("Error loading presets from %s: %s", filePath_.c_str(), e.what());
            return false;
        }

        size_t registered = 0;
        for (const auto& preset : loaded) {
            if (catalog.registerPreset(preset)) {
                ++registered;
            }
        }
        logInfo("Loaded %zu presets from %s", registered, filePath_.c_str());
        return registered == loaded.size();
    }

    bool savePresets(const presets::PresetCatalog& catalog) override {
        try {
            nlohmann::json j = nlohmann::json::array();
            for (const auto& id : catalog.ids()) {
                j.push_back(*catalog.find(id));
            }

            std::ofstream file(filePath_);
            if (!file.is_open()) {
                logError("Failed to open %s for writing", filePath_.c_str());
                return false;
            }
            file << j.dump(2);
            logInfo("Saved %zu presets to %s", catalog.size(), filePath_.c_str());
            return true;
        } catch (const std::exception& e) {
            logError("Error saving presets to %s: %s", filePath_.c_str(), e.what());
            return false;
        }
    }

    const std::string& getFilePath() const { return filePath_; }

private:
    std::string filePath_;
};

} // namespace features
