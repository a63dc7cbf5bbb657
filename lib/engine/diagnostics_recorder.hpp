#ifndef DIAGNOSTICS_RECORDER_HPP
#define DIAGNOSTICS_RECORDER_HPP

#include "audio_context.hpp"
#include "voice_event.hpp"
#include <telemetry_sink.hpp>
#include <voice_snapshot.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace engine {

/**
 * @brief One recorded voice event with the voice state around it
 */
struct LogEntry {
    uint64_t sequence = 0;
    double timestamp = 0.0;
    VoiceEventType event = VoiceEventType::NOTE_ON;
    int midiNote = VoiceEvent::NO_NOTE;
    std::string noteName;
    std::string message;
    size_t activeVoiceCount = 0;
    std::vector<synth::VoiceSnapshot> immediate;
    std::vector<synth::VoiceSnapshot> delayed;
    bool delayedCaptured = false;
    TimerHandle delayedCapture;
};

/**
 * @brief Bounded log of voice events for debugging voice allocation
 *
 * Each event stores the active voices at the moment it happened and again
 * a short time later, captured by a timer on the engine clock. The oldest
 * entry is evicted once the log is full; evicting or clearing an entry
 * cancels its pending capture.
 */
class DiagnosticsRecorder : public features::TelemetrySink<VoiceEvent> {
public:
    using SnapshotSource = std::function<std::vector<synth::VoiceSnapshot>()>;

    static constexpr size_t DEFAULT_CAPACITY = 1000;
    static constexpr double DEFAULT_CAPTURE_DELAY = 0.05;

    /**
     * @param context Clock and timer queue; must outlive the recorder
     * @param snapshotSource Returns the currently active voices
     * @param capacity Maximum retained entries
     * @param captureDelay Seconds between an event and its delayed capture
     */
    DiagnosticsRecorder(AudioContext& context, SnapshotSource snapshotSource,
                        size_t capacity = DEFAULT_CAPACITY,
                        double captureDelay = DEFAULT_CAPTURE_DELAY);
    ~DiagnosticsRecorder() override;

    DiagnosticsRecorder(const DiagnosticsRecorder&) = delete;
    DiagnosticsRecorder& operator=(const DiagnosticsRecorder&) = delete;

    void sendTelemetry(const VoiceEvent& event) override { record(event); }

    void record(const VoiceEvent& event);

    /**
     * @brief Remove every entry and cancel every pending capture
     */
    void clear();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t pendingCaptureCount() const;
    const std::deque<LogEntry>& entries() const { return entries_; }

    /**
     * @brief Human-readable report of every entry, oldest first
     */
    std::string exportText() const;

    /**
     * @brief The same report as a JSON document
     */
    std::string exportJson(int indent = 2) const;

    /**
     * @brief Write exportText() to a file
     * @return false if the file could not be written
     */
    bool writeText(const std::string& path) const;

private:
    void captureDelayed(uint64_t sequence);

    AudioContext& context_;
    SnapshotSource snapshotSource_;
    size_t capacity_;
    double captureDelay_;
    uint64_t nextSequence_ = 1;
    std::deque<LogEntry> entries_;
};

} // namespace engine

#endif // DIAGNOSTICS_RECORDER_HPP
