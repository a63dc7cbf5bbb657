#include "alsa_pcm_out.hpp"
#include <log.hpp>
#include <cerrno>
#include <stdexcept>

namespace alsa {

namespace {

void check(int err, const char* what) {
    if (err < 0) {
        throw std::runtime_error(std::string(what) + ": " + snd_strerror(err));
    }
}

} // namespace

AlsaPcmOut::AlsaPcmOut(const PcmSettings& settings) {
    if (settings.channels < 1 || settings.channels > 2) {
        throw std::invalid_argument("Playback supports 1 or 2 channels, got " +
                                    std::to_string(settings.channels));
    }
    if (settings.periodFrames == 0 || settings.periods < 2) {
        throw std::invalid_argument("Playback needs a non-empty period and at least 2 periods");
    }

    int err = snd_pcm_open(&pcm_, settings.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        pcm_ = nullptr;
        throw std::runtime_error("Cannot open audio device " + settings.device + ": " + snd_strerror(err));
    }

    try {
        configureHardware(settings);
        configureSoftware();
    } catch (const std::runtime_error&) {
        close();
        throw;
    }

    if (sampleRate_ != settings.sampleRate) {
        logWarn("Device rate %u Hz differs from requested %u Hz", sampleRate_, settings.sampleRate);
    }
    period_.assign(static_cast<size_t>(periodFrames_) * channels_, 0.0f);
}

AlsaPcmOut::~AlsaPcmOut() {
    if (pcm_) {
        snd_pcm_drain(pcm_);
    }
    close();
}

void AlsaPcmOut::configureHardware(const PcmSettings& settings) {
    snd_pcm_hw_params_t* hw;
    snd_pcm_hw_params_alloca(&hw);
    check(snd_pcm_hw_params_any(pcm_, hw), "No playback configuration available");
    check(snd_pcm_hw_params_set_access(pcm_, hw, SND_PCM_ACCESS_RW_INTERLEAVED), "Interleaved access unsupported");
    check(snd_pcm_hw_params_set_format(pcm_, hw, SND_PCM_FORMAT_FLOAT_LE), "Float samples unsupported");

    channels_ = settings.channels;
    check(snd_pcm_hw_params_set_channels_near(pcm_, hw, &channels_), "Cannot set channel count");

    sampleRate_ = settings.sampleRate;
    check(snd_pcm_hw_params_set_rate_near(pcm_, hw, &sampleRate_, nullptr), "Cannot set sample rate");

    snd_pcm_uframes_t period = settings.periodFrames;
    check(snd_pcm_hw_params_set_period_size_near(pcm_, hw, &period, nullptr), "Cannot set period size");

    bufferFrames_ = period * settings.periods;
    check(snd_pcm_hw_params_set_buffer_size_near(pcm_, hw, &bufferFrames_), "Cannot set buffer size");

    check(snd_pcm_hw_params(pcm_, hw), "Cannot apply hardware parameters");

    // Re-read: the buffer request can move the period
    check(snd_pcm_hw_params_get_period_size(hw, &period, nullptr), "Cannot read period size");
    periodFrames_ = static_cast<unsigned int>(period);
}

void AlsaPcmOut::configureSoftware() {
    snd_pcm_sw_params_t* sw;
    snd_pcm_sw_params_alloca(&sw);
    check(snd_pcm_sw_params_current(pcm_, sw), "Cannot read software parameters");
    // Start as soon as one period is queued so note-ons are heard promptly
    check(snd_pcm_sw_params_set_start_threshold(pcm_, sw, periodFrames_), "Cannot set start threshold");
    check(snd_pcm_sw_params_set_avail_min(pcm_, sw, periodFrames_), "Cannot set wakeup size");
    check(snd_pcm_sw_params(pcm_, sw), "Cannot apply software parameters");
}

void AlsaPcmOut::writeAll(const float* frames, unsigned int count) {
    while (count > 0) {
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_, frames, count);
        if (written == -EAGAIN) {
            continue;
        }
        if (written < 0) {
            if (written == -EPIPE || written == -ESTRPIPE) {
                ++xruns_;
                logWarn("Audio %s (%u so far)", written == -EPIPE ? "underrun" : "suspend", xruns_);
            }
            check(snd_pcm_recover(pcm_, static_cast<int>(written), 1), "Audio write failed");
            continue;
        }
        frames += static_cast<size_t>(written) * channels_;
        count -= static_cast<unsigned int>(written);
    }
}

void AlsaPcmOut::close() {
    if (pcm_) {
        snd_pcm_close(pcm_);
        pcm_ = nullptr;
    }
}

} // namespace alsa
