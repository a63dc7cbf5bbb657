#ifndef VOICE_ALLOCATOR_HPP
#define VOICE_ALLOCATOR_HPP

#include "audio_context.hpp"
#include "timer_queue.hpp"
#include "voice_event.hpp"
#include <harmonic_voice.hpp>
#include <preset.hpp>
#include <telemetry_sink.hpp>
#include <voice_builder.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace engine {

/**
 * @brief One sounding note and its lifecycle bookkeeping
 */
struct Voice {
    uint64_t id = 0;
    int midiNote = 0;
    std::unique_ptr<synth::HarmonicVoice> graph;
    double startTime = 0.0;
    float releaseSeconds = 0.0f;
    bool released = false;
    TimerHandle autoStopTimer;
    TimerHandle cleanupTimer;
};

/**
 * @brief Owns every voice and enforces the polyphony ceiling
 *
 * At most one voice per MIDI note is active. Starting a note that is
 * already sounding, or one that would exceed the ceiling, first forces the
 * old (or oldest) voice into release and detaches it from its note; the
 * detached voice keeps rendering its tail until its cleanup timer removes
 * it. Released voices that were not detached stay active until cleanup.
 *
 * Every lifecycle change is published to the telemetry sink.
 */
class VoiceAllocator {
public:
    static constexpr size_t MAX_POLYPHONY = 24;
    static constexpr double CLEANUP_GRACE_SECONDS = 0.15;
    static constexpr double MIN_AUTO_RELEASE_SECONDS = 4.0;
    static constexpr double MAX_AUTO_RELEASE_SECONDS = 8.0;
    static constexpr float RELEASE_FLOOR = 0.0001f;
    static constexpr float RELEASE_FILTER_FLOOR = 100.0f;

    /**
     * @param context Clock and timers; must outlive the allocator
     * @param builder Builds the signal graph of each new voice
     * @param telemetrySink Receives voice events (use NoTelemetrySink if not needed)
     */
    VoiceAllocator(AudioContext& context,
                   synth::VoiceSynthesisBuilder& builder,
                   features::TelemetrySink<VoiceEvent>& telemetrySink,
                   size_t maxPolyphony = MAX_POLYPHONY);
    ~VoiceAllocator();

    VoiceAllocator(const VoiceAllocator&) = delete;
    VoiceAllocator& operator=(const VoiceAllocator&) = delete;

    void setTelemetrySink(features::TelemetrySink<VoiceEvent>& telemetrySink) {
        telemetrySink_ = &telemetrySink;
    }

    /**
     * @brief Start a new voice for midiNote
     * @param velocity Note velocity in [0, 1]
     * @return The new voice, now the active voice for midiNote
     */
    Voice& noteOn(int midiNote, float velocity, const presets::Preset& preset);

    /**
     * @brief Release the active voice for midiNote
     * @return false, with no event published, if no voice is active for the note
     */
    bool noteOff(int midiNote);

    /**
     * @brief Start the release tail and schedule cleanup; no-op if already released
     */
    void releaseVoice(Voice& voice);

    /**
     * @brief Release every active voice
     */
    void stopAll();

    /**
     * @brief Cancel all timers and silence every voice immediately
     */
    void forceStopAll();

    /**
     * @brief Add every live voice into the bus
     * @param startTime Engine time of the first frame
     */
    void render(float* left, float* right, unsigned int numFrames, double startTime);

    size_t activeVoiceCount() const { return activeVoices_.size(); }

    /**
     * @brief All voices still rendering, including detached release tails
     */
    size_t voiceCount() const { return voices_.size(); }

    size_t maxPolyphony() const { return maxPolyphony_; }

    Voice* findVoice(int midiNote) const;

    /**
     * @brief Snapshot every sounding voice: note map voices in note order,
     * then displaced release tails flagged as released
     */
    std::vector<synth::VoiceSnapshot> snapshotActiveVoices() const;

    /**
     * @brief Auto-release delay for a voice built from preset
     */
    static double autoReleaseSeconds(const presets::Preset& preset);

private:
    void publish(VoiceEventType type, int midiNote, const std::string& message);
    void detach(Voice& voice);
    void cleanup(uint64_t voiceId);
    void autoRelease(uint64_t voiceId);
    Voice* findById(uint64_t voiceId) const;
    Voice* oldestActiveVoice() const;

    AudioContext& context_;
    synth::VoiceSynthesisBuilder& builder_;
    features::TelemetrySink<VoiceEvent>* telemetrySink_;
    size_t maxPolyphony_;
    uint64_t nextVoiceId_ = 1;

    std::vector<std::unique_ptr<Voice>> voices_;
    std::map<int, Voice*> activeVoices_;
};

} // namespace engine

#endif // VOICE_ALLOCATOR_HPP
