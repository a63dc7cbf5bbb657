#ifndef VOICE_EVENT_HPP
#define VOICE_EVENT_HPP

#include <string>

namespace engine {

enum class VoiceEventType {
    NOTE_ON,
    NOTE_OFF,
    VOICE_STEAL,
    VOICE_RELEASE,
    STOP_ALL
};

inline const char* toString(VoiceEventType type) {
    switch (type) {
        case VoiceEventType::NOTE_ON: return "NOTE_ON";
        case VoiceEventType::NOTE_OFF: return "NOTE_OFF";
        case VoiceEventType::VOICE_STEAL: return "VOICE_STEAL";
        case VoiceEventType::VOICE_RELEASE: return "VOICE_RELEASE";
        case VoiceEventType::STOP_ALL: return "STOP_ALL";
    }
    return "UNKNOWN";
}

/**
 * @brief One voice lifecycle event published by the allocator
 */
struct VoiceEvent {
    static constexpr int NO_NOTE = -1;

    VoiceEventType type = VoiceEventType::NOTE_ON;
    int midiNote = NO_NOTE;
    std::string message;

    bool hasNote() const { return midiNote != NO_NOTE; }
};

} // namespace engine

#endif // VOICE_EVENT_HPP
