#include "voice_allocator.hpp"
#include <log.hpp>
#include <pitch.hpp>
#include <algorithm>
#include <cstdio>

namespace engine {

VoiceAllocator::VoiceAllocator(AudioContext& context,
                               synth::VoiceSynthesisBuilder& builder,
                               features::TelemetrySink<VoiceEvent>& telemetrySink,
                               size_t maxPolyphony)
    : context_(context)
    , builder_(builder)
    , telemetrySink_(&telemetrySink)
    , maxPolyphony_(maxPolyphony > 0 ? maxPolyphony : 1) {
    voices_.reserve(maxPolyphony_ * 2);
}

VoiceAllocator::~VoiceAllocator() {
    forceStopAll();
}

double VoiceAllocator::autoReleaseSeconds(const presets::Preset& preset) {
    double duration = preset.decay * 2.0 + preset.release * 2.0 + 1.0;
    return std::min(MAX_AUTO_RELEASE_SECONDS, std::max(MIN_AUTO_RELEASE_SECONDS, duration));
}

void VoiceAllocator::publish(VoiceEventType type, int midiNote, const std::string& message) {
    VoiceEvent event;
    event.type = type;
    event.midiNote = midiNote;
    event.message = message;
    telemetrySink_->sendTelemetry(event);
}

Voice& VoiceAllocator::noteOn(int midiNote, float velocity, const presets::Preset& preset) {
    const std::string noteName = synth::midiToNoteName(midiNote);

    // A retriggered note releases its previous voice before the new attack
    auto existing = activeVoices_.find(midiNote);
    if (existing != activeVoices_.end()) {
        Voice& previous = *existing->second;
        releaseVoice(previous);
        detach(previous);
    }

    if (activeVoices_.size() >= maxPolyphony_) {
        Voice* oldest = oldestActiveVoice();
        if (oldest != nullptr) {
            char message[160];
            snprintf(message, sizeof(message),
                     "Voice stealing: releasing %s to make room for %s (MAX_POLYPHONY=%zu)",
                     synth::midiToNoteName(oldest->midiNote).c_str(), noteName.c_str(), maxPolyphony_);
            publish(VoiceEventType::VOICE_STEAL, oldest->midiNote, message);
            releaseVoice(*oldest);
            detach(*oldest);
        }
    }

    const double now = context_.currentTime();
    auto voice = std::make_unique<Voice>();
    voice->id = nextVoiceId_++;
    voice->midiNote = midiNote;
    voice->graph = builder_.build(midiNote, velocity, preset, now);
    voice->startTime = now;
    voice->releaseSeconds = preset.release;

    Voice& created = *voice;
    voices_.push_back(std::move(voice));
    activeVoices_[midiNote] = &created;

    char message[192];
    snprintf(message, sizeof(message), "Note ON: %s (%.2f Hz), velocity %.2f, preset %s",
             noteName.c_str(), synth::midiToFrequency(midiNote), velocity, preset.name.c_str());
    publish(VoiceEventType::NOTE_ON, midiNote, message);

    const uint64_t voiceId = created.id;
    created.autoStopTimer = context_.timers().schedule(
        now + autoReleaseSeconds(preset),
        [this, voiceId]() { autoRelease(voiceId); });

    logDebug("Voice %llu on note %d, %zu active", static_cast<unsigned long long>(voiceId),
             midiNote, activeVoices_.size());
    return created;
}

bool VoiceAllocator::noteOff(int midiNote) {
    Voice* voice = findVoice(midiNote);
    if (voice == nullptr) {
        return false;
    }
    publish(VoiceEventType::NOTE_OFF, midiNote, "Stop note " + synth::midiToNoteName(midiNote));
    releaseVoice(*voice);
    return true;
}

void VoiceAllocator::releaseVoice(Voice& voice) {
    if (voice.released) {
        return;
    }
    voice.released = true;

    char message[128];
    snprintf(message, sizeof(message), "Releasing voice for %s (release time: %.2fs)",
             synth::midiToNoteName(voice.midiNote).c_str(), voice.releaseSeconds);
    publish(VoiceEventType::VOICE_RELEASE, voice.midiNote, message);

    context_.timers().cancel(voice.autoStopTimer);

    const double now = context_.currentTime();
    const double releaseTime = voice.releaseSeconds;

    // Exponential fall from wherever the envelope is now; it never reaches zero
    synth::AutomationParam& gain = voice.graph->mainGain();
    const float currentGain = std::max(gain.valueAt(now), RELEASE_FLOOR);
    gain.cancelScheduledValues(now);
    gain.setValueAtTime(currentGain, now);
    gain.exponentialRampToValueAtTime(RELEASE_FLOOR, now + releaseTime);

    synth::AutomationParam& cutoff = voice.graph->filterFrequency();
    const float currentCutoff = std::max(cutoff.valueAt(now), RELEASE_FILTER_FLOOR);
    cutoff.cancelScheduledValues(now);
    cutoff.setValueAtTime(currentCutoff, now);
    cutoff.exponentialRampToValueAtTime(RELEASE_FILTER_FLOOR, now + releaseTime * 0.8);

    const uint64_t voiceId = voice.id;
    context_.timers().cancel(voice.cleanupTimer);
    voice.cleanupTimer = context_.timers().schedule(
        now + releaseTime + CLEANUP_GRACE_SECONDS,
        [this, voiceId]() { cleanup(voiceId); });
}

void VoiceAllocator::stopAll() {
    char message[64];
    snprintf(message, sizeof(message), "Stopping all voices (count: %zu)", activeVoices_.size());
    publish(VoiceEventType::STOP_ALL, VoiceEvent::NO_NOTE, message);

    std::vector<Voice*> active;
    active.reserve(activeVoices_.size());
    for (const auto& entry : activeVoices_) {
        active.push_back(entry.second);
    }
    for (Voice* voice : active) {
        releaseVoice(*voice);
    }
}

void VoiceAllocator::forceStopAll() {
    for (auto& voice : voices_) {
        context_.timers().cancel(voice->autoStopTimer);
        context_.timers().cancel(voice->cleanupTimer);
        voice->graph->disconnect();
    }
    activeVoices_.clear();
    voices_.clear();
}

void VoiceAllocator::detach(Voice& voice) {
    auto it = activeVoices_.find(voice.midiNote);
    if (it != activeVoices_.end() && it->second == &voice) {
        activeVoices_.erase(it);
    }
}

void VoiceAllocator::cleanup(uint64_t voiceId) {
    auto it = std::find_if(voices_.begin(), voices_.end(),
                           [voiceId](const std::unique_ptr<Voice>& v) { return v->id == voiceId; });
    if (it == voices_.end()) {
        return;
    }
    Voice& voice = **it;
    context_.timers().cancel(voice.autoStopTimer);
    voice.graph->disconnect();
    detach(voice);
    voices_.erase(it);
    logDebug("Cleaned up voice %llu, %zu active", static_cast<unsigned long long>(voiceId),
             activeVoices_.size());
}

void VoiceAllocator::autoRelease(uint64_t voiceId) {
    Voice* voice = findById(voiceId);
    if (voice == nullptr || voice->released) {
        return;
    }
    if (findVoice(voice->midiNote) == voice) {
        releaseVoice(*voice);
    }
}

Voice* VoiceAllocator::findVoice(int midiNote) const {
    auto it = activeVoices_.find(midiNote);
    return it != activeVoices_.end() ? it->second : nullptr;
}

Voice* VoiceAllocator::findById(uint64_t voiceId) const {
    for (const auto& voice : voices_) {
        if (voice->id == voiceId) {
            return voice.get();
        }
    }
    return nullptr;
}

Voice* VoiceAllocator::oldestActiveVoice() const {
    Voice* oldest = nullptr;
    for (const auto& entry : activeVoices_) {
        if (oldest == nullptr || entry.second->startTime < oldest->startTime) {
            oldest = entry.second;
        }
    }
    return oldest;
}

std::vector<synth::VoiceSnapshot> VoiceAllocator::snapshotActiveVoices() const {
    std::vector<synth::VoiceSnapshot> snapshots;
    snapshots.reserve(voices_.size());
    const double now = context_.currentTime();
    for (const auto& entry : activeVoices_) {
        const Voice& voice = *entry.second;
        snapshots.push_back(voice.graph->snapshot(now, voice.released));
    }
    // Retriggered and stolen voices still fading out, oldest first
    for (const auto& voice : voices_) {
        if (findVoice(voice->midiNote) != voice.get()) {
            snapshots.push_back(voice->graph->snapshot(now, true));
        }
    }
    return snapshots;
}

void VoiceAllocator::render(float* left, float* right, unsigned int numFrames, double startTime) {
    for (auto& voice : voices_) {
        voice->graph->render(left, right, numFrames, startTime);
    }
}

} // namespace engine
