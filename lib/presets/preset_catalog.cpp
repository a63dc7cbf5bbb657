#include "preset_catalog.hpp"
#include <log.hpp>

namespace presets {

const char* const PresetCatalog::DEFAULT_PRESET_ID = "piano";

namespace {

Preset makePreset(const char* id, const char* name, std::vector<float> harmonics,
                  float attack, float decay, float sustain, float release,
                  float filterCutoff, float filterQ, float filterEnvelope,
                  float vibratoRate, float vibratoDepth, float detuneSpread) {
    Preset p;
    p.id = id;
    p.name = name;
    p.harmonics = std::move(harmonics);
    p.attack = attack;
    p.decay = decay;
    p.sustain = sustain;
    p.release = release;
    p.filterCutoff = filterCutoff;
    p.filterQ = filterQ;
    p.filterEnvelope = filterEnvelope;
    p.vibratoRate = vibratoRate;
    p.vibratoDepth = vibratoDepth;
    p.detuneSpread = detuneSpread;
    return p;
}

} // namespace

std::vector<Preset> PresetCatalog::builtInPresets() {
    std::vector<Preset> list;

    Preset piano = makePreset("piano", "Acoustic Piano", {1.0f, 0.5f, 0.35f, 0.15f, 0.08f},
                              0.005f, 0.8f, 0.2f, 1.2f,
                              5000.0f, 0.7f, 0.6f,
                              0.0f, 0.0f, 4.0f);
    piano.stereoSpread = 0.25f;
    list.push_back(piano);

    // Bright pluck with a noisy pick transient
    Preset guitar = makePreset("guitar", "Nylon Guitar", {1.0f, 0.6f, 0.4f, 0.25f, 0.12f, 0.06f},
                               0.003f, 0.6f, 0.1f, 0.8f,
                               3200.0f, 1.2f, 1.2f,
                               0.0f, 0.0f, 3.0f);
    guitar.pluckNoiseLevel = 0.35f;
    guitar.pluckNoiseDecay = 0.08f;
    guitar.stereoSpread = 0.3f;
    list.push_back(guitar);

    Preset organ = makePreset("organ", "Drawbar Organ", {1.0f, 0.8f, 0.6f, 0.0f, 0.4f, 0.0f, 0.0f, 0.3f},
                              0.02f, 0.1f, 0.9f, 0.15f,
                              7000.0f, 0.5f, 0.0f,
                              5.5f, 6.0f, 2.0f);
    list.push_back(organ);

    Preset epiano = makePreset("epiano", "Electric Piano", {1.0f, 0.3f, 0.2f, 0.05f},
                               0.004f, 1.2f, 0.3f, 0.9f,
                               4200.0f, 1.0f, 0.8f,
                               4.0f, 3.0f, 5.0f);
    epiano.saturationAmount = 0.25f;
    epiano.stereoSpread = 0.4f;
    list.push_back(epiano);

    Preset pad = makePreset("pad", "Warm Pad", {1.0f, 0.7f, 0.5f, 0.35f, 0.2f, 0.1f},
                            0.6f, 1.5f, 0.7f, 2.0f,
                            2200.0f, 2.0f, 0.4f,
                            0.3f, 8.0f, 12.0f);
    pad.saturationAmount = 0.1f;
    pad.stereoSpread = 0.6f;
    list.push_back(pad);

    return list;
}

PresetCatalog::PresetCatalog() {
    for (const Preset& preset : builtInPresets()) {
        presets_[preset.id] = preset;
    }
}

const Preset* PresetCatalog::find(const std::string& id) const {
    auto it = presets_.find(id);
    return it != presets_.end() ? &it->second : nullptr;
}

const Preset& PresetCatalog::defaultPreset() const {
    return presets_.at(DEFAULT_PRESET_ID);
}

const Preset& PresetCatalog::resolve(const std::string& id) const {
    const Preset* preset = find(id);
    if (preset == nullptr) {
        logWarn("Unknown instrument '%s', using '%s'", id.c_str(), DEFAULT_PRESET_ID);
        return defaultPreset();
    }
    return *preset;
}

bool PresetCatalog::registerPreset(const Preset& preset) {
    if (preset.id.empty()) {
        logError("Refusing to register preset without an id");
        return false;
    }
    bool replaced = contains(preset.id);
    presets_[preset.id] = preset;
    logInfo("%s preset '%s' (%s)", replaced ? "Replaced" : "Registered",
            preset.id.c_str(), preset.name.c_str());
    return true;
}

std::vector<std::string> PresetCatalog::ids() const {
    std::vector<std::string> result;
    result.reserve(presets_.size());
    for (const auto& entry : presets_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace presets
