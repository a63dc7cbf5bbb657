#ifndef PITCH_HPP
#define PITCH_HPP

#include <cmath>
#include <string>

namespace synth {

/**
 * @brief Equal-tempered frequency of a MIDI note (A4 = note 69 = 440 Hz)
 */
inline double midiToFrequency(int midiNote) {
    return 440.0 * std::pow(2.0, (midiNote - 69) / 12.0);
}

/**
 * @brief Note name with octave, e.g. 60 -> "C4", 61 -> "C#4"
 */
inline std::string midiToNoteName(int midiNote) {
    static const char* const NAMES[12] = {
        "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
    };
    int pitchClass = ((midiNote % 12) + 12) % 12;
    int octave = static_cast<int>(std::floor(midiNote / 12.0)) - 1;
    return std::string(NAMES[pitchClass]) + std::to_string(octave);
}

} // namespace synth

#endif // PITCH_HPP
