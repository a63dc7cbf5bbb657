#ifndef VOICE_SNAPSHOT_HPP
#define VOICE_SNAPSHOT_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace synth {

struct OscillatorSnapshot {
    int harmonic = 1;
    float frequencyHz = 0.0f;
    float amplitude = 0.0f;
    float detuneCents = 0.0f;
};

/**
 * @brief Read-only view of a sounding voice at one instant
 *
 * Diagnostic only; nothing in the synthesis path reads it back.
 */
struct VoiceSnapshot {
    int midiNote = 0;
    std::string noteName;
    double age = 0.0;
    bool released = false;
    std::string presetId;
    std::vector<OscillatorSnapshot> oscillators;
    std::vector<float> gainValues;
    float filterCutoff = 0.0f;
    float filterQ = 0.0f;
    float filterEnvelope = 0.0f;
    float mainGain = 0.0f;
    std::vector<std::string> extraNodes;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(OscillatorSnapshot,
    harmonic, frequencyHz, amplitude, detuneCents)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VoiceSnapshot,
    midiNote, noteName, age, released, presetId, oscillators, gainValues,
    filterCutoff, filterQ, filterEnvelope, mainGain, extraNodes)

} // namespace synth

#endif // VOICE_SNAPSHOT_HPP
