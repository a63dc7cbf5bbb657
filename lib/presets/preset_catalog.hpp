#ifndef PRESET_CATALOG_HPP
#define PRESET_CATALOG_HPP

#include "preset.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace presets {

/**
 * @brief Named instrument presets, with a guaranteed default
 *
 * Starts with the built-in instruments. Lookups by unknown name resolve to
 * the default preset so playback always stays audible.
 */
class PresetCatalog {
public:
    static const char* const DEFAULT_PRESET_ID;

    PresetCatalog();

    /**
     * @brief Preset for id, or the default preset when id is unknown
     */
    const Preset& resolve(const std::string& id) const;

    /**
     * @brief Preset for id, or nullptr
     */
    const Preset* find(const std::string& id) const;

    bool contains(const std::string& id) const { return presets_.count(id) != 0; }

    /**
     * @brief Add a preset, replacing any preset with the same id
     * @return false if the preset has an empty id
     */
    bool registerPreset(const Preset& preset);

    const Preset& defaultPreset() const;

    std::vector<std::string> ids() const;
    size_t size() const { return presets_.size(); }

    /**
     * @brief The instruments every catalog starts with
     */
    static std::vector<Preset> builtInPresets();

private:
    std::map<std::string, Preset> presets_;
};

} // namespace presets

#endif // PRESET_CATALOG_HPP
