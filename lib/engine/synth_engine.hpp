#ifndef SYNTH_ENGINE_HPP
#define SYNTH_ENGINE_HPP

#include "audio_context.hpp"
#include "diagnostics_recorder.hpp"
#include "voice_allocator.hpp"
#include "voice_event.hpp"
#include <effects_bus.hpp>
#include <harmonic_voice.hpp>
#include <engine_config.hpp>
#include <preset_catalog.hpp>
#include <preset_storage.hpp>
#include <telemetry_sink.hpp>
#include <voice_builder.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace engine {

/**
 * @brief Polyphonic preset-driven synthesizer
 *
 * The single entry point for hosts. Nothing is allocated for audio until
 * init(); before that, note calls are ignored and setters only remember
 * their values. Rendering pulls fixed 128-frame quanta; deferred work
 * (auto-release, voice cleanup, delayed log capture) runs between quanta.
 *
 * Not thread-safe: call everything from the thread that renders audio.
 */
class SynthEngine {
public:
    static constexpr unsigned int RENDER_QUANTUM = synth::HarmonicVoice::MAX_BLOCK_FRAMES;

    /**
     * @param config Engine settings
     * @param presetStorage Optional source of extra presets, loaded immediately
     */
    explicit SynthEngine(const platform::EngineConfig& config = platform::EngineConfig(),
                         std::unique_ptr<features::PresetStorage> presetStorage = nullptr);
    ~SynthEngine();

    SynthEngine(const SynthEngine&) = delete;
    SynthEngine& operator=(const SynthEngine&) = delete;

    /**
     * @brief Create the audio context and output bus, or resume a suspended context
     */
    void init();

    /**
     * @brief Start a note; ignored before init() or outside MIDI range 0-127
     * @param velocity Clamped to [0, 1]
     */
    void playNote(int midiNote, float velocity = 0.8f);
    void stopNote(int midiNote);
    void stopAll();

    /**
     * @brief Select the preset used by subsequent notes
     *
     * Unknown names select the default preset.
     */
    void setInstrument(const std::string& name);
    void setReverbMix(float mix);
    void setVolume(float volume);

    /**
     * @brief Write the diagnostics report to path
     * @return false before init() or if the file cannot be written
     */
    bool downloadLog(const std::string& path) const;
    std::string exportLog() const;
    std::string exportLogJson() const;
    void clearLog();
    size_t getLogCount() const;

    /**
     * @brief Render interleaved output frames
     *
     * Writes silence while uninitialized or suspended; the clock only
     * advances while running.
     */
    void renderAudio(float* interleaved, unsigned int numFrames);

    void suspend();

    /**
     * @brief Cancel every timer, silence every voice and close the context
     */
    void shutdown();

    bool isInitialized() const { return context_ != nullptr; }
    bool isRunning() const { return context_ && context_->isRunning(); }
    double currentTime() const { return context_ ? context_->currentTime() : 0.0; }
    size_t activeVoiceCount() const { return allocator_ ? allocator_->activeVoiceCount() : 0; }
    size_t voiceCount() const { return allocator_ ? allocator_->voiceCount() : 0; }

    const std::string& currentInstrument() const { return instrument_; }
    float reverbMix() const { return reverbMix_; }
    float volume() const { return volume_; }
    const platform::EngineConfig& config() const { return config_; }

    presets::PresetCatalog& presets() { return catalog_; }
    const presets::PresetCatalog& presets() const { return catalog_; }

    AudioContext* context() { return context_.get(); }
    VoiceAllocator* allocator() { return allocator_.get(); }
    synth::EffectsBus* effectsBus() { return effectsBus_.get(); }
    const DiagnosticsRecorder* recorder() const { return recorder_.get(); }

private:
    void renderQuantum();

    platform::EngineConfig config_;
    presets::PresetCatalog catalog_;
    std::string instrument_;
    float reverbMix_;
    float volume_;

    features::NoTelemetrySink<VoiceEvent> noTelemetry_;

    // Members below reference the context, so they are declared after it
    std::unique_ptr<AudioContext> context_;
    std::unique_ptr<synth::EffectsBus> effectsBus_;
    std::unique_ptr<synth::VoiceSynthesisBuilder> builder_;
    std::unique_ptr<VoiceAllocator> allocator_;
    std::unique_ptr<DiagnosticsRecorder> recorder_;

    float quantumLeft_[RENDER_QUANTUM];
    float quantumRight_[RENDER_QUANTUM];
    unsigned int quantumPosition_ = RENDER_QUANTUM;
};

} // namespace engine

#endif // SYNTH_ENGINE_HPP
