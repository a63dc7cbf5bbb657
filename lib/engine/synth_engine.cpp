#include "synth_engine.hpp"
#include <log.hpp>
#include <algorithm>
#include <cstring>

namespace engine {

SynthEngine::SynthEngine(const platform::EngineConfig& config,
                         std::unique_ptr<features::PresetStorage> presetStorage)
    : config_(config)
    , instrument_(presets::PresetCatalog::DEFAULT_PRESET_ID)
    , reverbMix_(std::min(1.0f, std::max(0.0f, config.reverbMix)))
    , volume_(std::max(0.0f, config.volume)) {
    if (presetStorage) {
        presetStorage->loadPresets(catalog_);
    }
    setInstrument(config.instrument);
}

SynthEngine::~SynthEngine() {
    shutdown();
}

void SynthEngine::init() {
    if (!context_) {
        const float sampleRate = static_cast<float>(config_.sampleRate);
        logInfo("Initializing engine: %u Hz, %u voices, instrument '%s'",
                config_.sampleRate, config_.maxPolyphony, instrument_.c_str());

        context_ = std::make_unique<AudioContext>(sampleRate);
        effectsBus_ = std::make_unique<synth::EffectsBus>(sampleRate, RENDER_QUANTUM, volume_, reverbMix_,
                                                       config_.randomSeed);

        // Offset so voice randomness does not repeat the reverb noise
        const unsigned int voiceSeed = config_.randomSeed != 0 ? config_.randomSeed + 1 : 0;
        builder_ = std::make_unique<synth::VoiceSynthesisBuilder>(sampleRate, voiceSeed);
        allocator_ = std::make_unique<VoiceAllocator>(*context_, *builder_, noTelemetry_, config_.maxPolyphony);

        VoiceAllocator* allocator = allocator_.get();
        recorder_ = std::make_unique<DiagnosticsRecorder>(
            *context_,
            [allocator]() { return allocator->snapshotActiveVoices(); },
            config_.logCapacity,
            config_.delayedCaptureMs / 1000.0);
        if (config_.diagnosticsEnabled) {
            allocator_->setTelemetrySink(*recorder_);
        }

        quantumPosition_ = RENDER_QUANTUM;
    }

    if (context_->state() == AudioContext::State::SUSPENDED) {
        context_->resume();
        logInfo("Audio context running");
    }
}

void SynthEngine::playNote(int midiNote, float velocity) {
    if (!allocator_) {
        return;
    }
    if (midiNote < 0 || midiNote > 127) {
        logWarn("Ignoring note %d outside MIDI range", midiNote);
        return;
    }
    velocity = std::min(1.0f, std::max(0.0f, velocity));
    allocator_->noteOn(midiNote, velocity, catalog_.resolve(instrument_));
}

void SynthEngine::stopNote(int midiNote) {
    if (!allocator_) {
        return;
    }
    allocator_->noteOff(midiNote);
}

void SynthEngine::stopAll() {
    if (!allocator_) {
        return;
    }
    allocator_->stopAll();
}

void SynthEngine::setInstrument(const std::string& name) {
    if (catalog_.contains(name)) {
        instrument_ = name;
    } else {
        logWarn("Unknown instrument '%s', using '%s'", name.c_str(),
                presets::PresetCatalog::DEFAULT_PRESET_ID);
        instrument_ = presets::PresetCatalog::DEFAULT_PRESET_ID;
    }
}

void SynthEngine::setReverbMix(float mix) {
    reverbMix_ = std::min(1.0f, std::max(0.0f, mix));
    if (effectsBus_) {
        effectsBus_->setReverbMix(reverbMix_);
    }
}

void SynthEngine::setVolume(float volume) {
    volume_ = std::max(0.0f, volume);
    if (effectsBus_) {
        effectsBus_->setVolume(volume_);
    }
}

bool SynthEngine::downloadLog(const std::string& path) const {
    if (!recorder_) {
        logWarn("No voice log to write before init");
        return false;
    }
    return recorder_->writeText(path);
}

std::string SynthEngine::exportLog() const {
    return recorder_ ? recorder_->exportText() : std::string();
}

std::string SynthEngine::exportLogJson() const {
    return recorder_ ? recorder_->exportJson() : std::string();
}

void SynthEngine::clearLog() {
    if (recorder_) {
        recorder_->clear();
    }
}

size_t SynthEngine::getLogCount() const {
    return recorder_ ? recorder_->size() : 0;
}

void SynthEngine::suspend() {
    if (context_) {
        context_->suspend();
    }
}

void SynthEngine::shutdown() {
    if (!context_) {
        return;
    }
    allocator_->forceStopAll();
    recorder_->clear();
    context_->close();

    recorder_.reset();
    allocator_.reset();
    builder_.reset();
    effectsBus_.reset();
    context_.reset();
    logInfo("Engine shut down");
}

void SynthEngine::renderQuantum() {
    context_->runDueTimers();

    std::fill(quantumLeft_, quantumLeft_ + RENDER_QUANTUM, 0.0f);
    std::fill(quantumRight_, quantumRight_ + RENDER_QUANTUM, 0.0f);
    allocator_->render(quantumLeft_, quantumRight_, RENDER_QUANTUM, context_->currentTime());
    effectsBus_->process(quantumLeft_, quantumRight_);

    context_->advance(RENDER_QUANTUM);
    quantumPosition_ = 0;
}

void SynthEngine::renderAudio(float* interleaved, unsigned int numFrames) {
    const unsigned int channels = std::max(1u, config_.channels);
    if (!isRunning()) {
        std::memset(interleaved, 0, sizeof(float) * numFrames * channels);
        return;
    }

    for (unsigned int frame = 0; frame < numFrames; ++frame) {
        if (quantumPosition_ >= RENDER_QUANTUM) {
            renderQuantum();
        }
        const float left = quantumLeft_[quantumPosition_];
        const float right = quantumRight_[quantumPosition_];
        ++quantumPosition_;

        float* out = interleaved + frame * channels;
        if (channels == 1) {
            out[0] = 0.5f * (left + right);
            continue;
        }
        out[0] = left;
        out[1] = right;
        for (unsigned int c = 2; c < channels; ++c) {
            out[c] = 0.0f;
        }
    }
}

} // namespace engine
