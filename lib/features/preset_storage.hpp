#pragma once

#include <preset_catalog.hpp>

namespace features {

/**
 * @brief Interface for persisting user presets
 *
 * Implementations decide where presets live. Failures are reported by
 * return value and logged; the catalog is left untouched on load failure.
 */
class PresetStorage {
public:
    virtual ~PresetStorage() = default;

    /**
     * @brief Load stored presets into the catalog
     * @return true if presets were read and registered
     */
    virtual bool loadPresets(presets::PresetCatalog& catalog) = 0;

    /**
     * @brief Store every preset currently in the catalog
     * @return true if the presets were written
     */
    virtual bool savePresets(const presets::PresetCatalog& catalog) = 0;
};

} // namespace features
