#include "diagnostics_recorder.hpp"
#include <log.hpp>
#include <pitch.hpp>
#include <nlohmann/json.hpp>
#include <cstdarg>
#include <cstdio>
#include <fstream>

namespace engine {

namespace {

// Formats straight into out, growing it to whatever length the line needs
void appendLine(std::string& out, const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list measure;
    va_copy(measure, args);
    const int length = vsnprintf(nullptr, 0, format, measure);
    va_end(measure);
    if (length > 0) {
        const size_t start = out.size();
        out.resize(start + static_cast<size_t>(length) + 1);
        vsnprintf(&out[start], static_cast<size_t>(length) + 1, format, args);
        out.resize(start + static_cast<size_t>(length));
    }
    va_end(args);
    out += '\n';
}

void appendVoices(std::string& out, const std::vector<synth::VoiceSnapshot>& voices) {
    for (size_t v = 0; v < voices.size(); ++v) {
        const synth::VoiceSnapshot& voice = voices[v];
        appendLine(out, "  Voice %zu:", v + 1);
        appendLine(out, "    MIDI: %d (%s)", voice.midiNote, voice.noteName.c_str());
        appendLine(out, "    Age: %.3fs", voice.age);
        appendLine(out, "    Released: %s", voice.released ? "true" : "false");
        appendLine(out, "    Preset: %s", voice.presetId.c_str());
        appendLine(out, "    Oscillators:");
        for (size_t i = 0; i < voice.oscillators.size(); ++i) {
            const synth::OscillatorSnapshot& osc = voice.oscillators[i];
            appendLine(out, "      Osc %zu: %.2f Hz (harmonic %d, amp %.3f, detune %+.2f cents)",
                       i, osc.frequencyHz, osc.harmonic, osc.amplitude, osc.detuneCents);
        }

        std::string gains;
        for (size_t i = 0; i < voice.gainValues.size(); ++i) {
            char value[32];
            snprintf(value, sizeof(value), "%s%.3f", i == 0 ? "" : ", ", voice.gainValues[i]);
            gains += value;
        }
        out += "    Gain Values: [" + gains + "]\n";
        appendLine(out, "    Filter: %.1f Hz (Q: %.2f, Env: %.2f)",
                   voice.filterCutoff, voice.filterQ, voice.filterEnvelope);
        appendLine(out, "    Main Gain: %.3f", voice.mainGain);

        std::string nodes;
        for (size_t i = 0; i < voice.extraNodes.size(); ++i) {
            if (i > 0) nodes += ", ";
            nodes += voice.extraNodes[i];
        }
        appendLine(out, "    Extra Nodes: [%s]", nodes.c_str());
        out += '\n';
    }
}

} // namespace

DiagnosticsRecorder::DiagnosticsRecorder(AudioContext& context, SnapshotSource snapshotSource,
                                         size_t capacity, double captureDelay)
    : context_(context)
    , snapshotSource_(std::move(snapshotSource))
    , capacity_(capacity > 0 ? capacity : 1)
    , captureDelay_(captureDelay) {
}

DiagnosticsRecorder::~DiagnosticsRecorder() {
    clear();
}

void DiagnosticsRecorder::record(const VoiceEvent& event) {
    LogEntry entry;
    entry.sequence = nextSequence_++;
    entry.timestamp = context_.currentTime();
    entry.event = event.type;
    entry.midiNote = event.midiNote;
    if (event.hasNote()) {
        entry.noteName = synth::midiToNoteName(event.midiNote);
    }
    entry.message = event.message;
    if (snapshotSource_) {
        entry.immediate = snapshotSource_();
    }
    entry.activeVoiceCount = entry.immediate.size();

    const uint64_t sequence = entry.sequence;
    entry.delayedCapture = context_.timers().schedule(
        context_.currentTime() + captureDelay_,
        [this, sequence]() { captureDelayed(sequence); });

    entries_.push_back(std::move(entry));

    while (entries_.size() > capacity_) {
        context_.timers().cancel(entries_.front().delayedCapture);
        entries_.pop_front();
    }
}

void DiagnosticsRecorder::captureDelayed(uint64_t sequence) {
    if (entries_.empty() || sequence < entries_.front().sequence) {
        return;
    }
    size_t index = static_cast<size_t>(sequence - entries_.front().sequence);
    if (index >= entries_.size()) {
        return;
    }
    LogEntry& entry = entries_[index];
    if (snapshotSource_) {
        entry.delayed = snapshotSource_();
    }
    entry.delayedCaptured = true;
}

void DiagnosticsRecorder::clear() {
    for (const LogEntry& entry : entries_) {
        context_.timers().cancel(entry.delayedCapture);
    }
    entries_.clear();
}

size_t DiagnosticsRecorder::pendingCaptureCount() const {
    size_t pending = 0;
    for (const LogEntry& entry : entries_) {
        if (context_.timers().isPending(entry.delayedCapture)) {
            ++pending;
        }
    }
    return pending;
}

std::string DiagnosticsRecorder::exportText() const {
    const std::string rule(80, '=');
    std::string out;
    out += rule + '\n';
    out += "AUDIO VOICE DEBUG LOG\n";
    appendLine(out, "Total Entries: %zu", entries_.size());
    out += rule + '\n';
    out += '\n';

    size_t number = 0;
    for (const LogEntry& entry : entries_) {
        appendLine(out, "=== Entry %zu ===", ++number);
        appendLine(out, "Timestamp: %.3fms (sequence %llu)", entry.timestamp * 1000.0,
                   static_cast<unsigned long long>(entry.sequence));
        appendLine(out, "Event: %s", toString(entry.event));
        appendLine(out, "Active Voices: %zu", entry.activeVoiceCount);
        if (entry.midiNote != VoiceEvent::NO_NOTE) {
            appendLine(out, "MIDI Note: %d (%s)", entry.midiNote, entry.noteName.c_str());
        }
        if (!entry.message.empty()) {
            out += "Message: " + entry.message + '\n';
        }
        out += '\n';

        appendLine(out, "--- Immediate State (T+0ms) ---");
        if (entry.immediate.empty()) {
            out += "  No active voices\n";
        } else {
            appendVoices(out, entry.immediate);
        }

        if (entry.delayedCaptured && !entry.delayed.empty()) {
            appendLine(out, "--- Delayed State (T+%.0fms) ---", captureDelay_ * 1000.0);
            appendVoices(out, entry.delayed);
        }
        out += '\n';
    }
    return out;
}

std::string DiagnosticsRecorder::exportJson(int indent) const {
    nlohmann::json log = nlohmann::json::array();
    for (const LogEntry& entry : entries_) {
        nlohmann::json j;
        j["sequence"] = entry.sequence;
        j["timestampMs"] = entry.timestamp * 1000.0;
        j["event"] = toString(entry.event);
        j["activeVoiceCount"] = entry.activeVoiceCount;
        if (entry.midiNote != VoiceEvent::NO_NOTE) {
            j["midiNote"] = entry.midiNote;
            j["noteName"] = entry.noteName;
        }
        if (!entry.message.empty()) {
            j["message"] = entry.message;
        }
        j["immediate"] = entry.immediate;
        if (entry.delayedCaptured) {
            j["delayed"] = entry.delayed;
        }
        log.push_back(std::move(j));
    }

    nlohmann::json document;
    document["totalEntries"] = entries_.size();
    document["entries"] = std::move(log);
    return document.dump(indent);
}

bool DiagnosticsRecorder::writeText(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        logError("Failed to open %s for writing", path.c_str());
        return false;
    }
    file << exportText();
    if (!file.good()) {
        logError("Failed to write voice log to %s", path.c_str());
        return false;
    }
    logInfo("Wrote %zu log entries to %s", entries_.size(), path.c_str());
    return true;
}

} // namespace engine
