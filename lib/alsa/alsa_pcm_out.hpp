#ifndef ALSA_PCM_OUT_HPP
#define ALSA_PCM_OUT_HPP

#include <alsa/asoundlib.h>
#include <cstddef>
#include <string>
#include <vector>

namespace alsa {

struct PcmSettings {
    std::string device = "default";
    unsigned int sampleRate = 44100;
    unsigned int channels = 2;
    unsigned int periodFrames = 128;
    unsigned int periods = 4;
};

/**
 * @brief Blocking ALSA playback of interleaved float periods
 *
 * The device may settle on a different rate or period size than requested;
 * callers read the negotiated values back after construction. Opening or
 * configuring the device throws std::runtime_error, bad settings throw
 * std::invalid_argument. Underruns and suspends are recovered and counted.
 */
class AlsaPcmOut {
public:
    explicit AlsaPcmOut(const PcmSettings& settings);
    ~AlsaPcmOut();

    AlsaPcmOut(const AlsaPcmOut&) = delete;
    AlsaPcmOut& operator=(const AlsaPcmOut&) = delete;

    /**
     * @brief Render one period and play all of it
     * @param render callback(float* interleaved, unsigned int numFrames)
     */
    template<typename Render>
    void playPeriod(Render render) {
        render(period_.data(), periodFrames_);
        writeAll(period_.data(), periodFrames_);
    }

    unsigned int getSampleRate() const { return sampleRate_; }
    unsigned int getChannels() const { return channels_; }
    unsigned int getPeriodFrames() const { return periodFrames_; }
    unsigned long getBufferFrames() const { return static_cast<unsigned long>(bufferFrames_); }
    unsigned int getXruns() const { return xruns_; }

private:
    void configureHardware(const PcmSettings& settings);
    void configureSoftware();
    void writeAll(const float* frames, unsigned int count);
    void close();

    snd_pcm_t* pcm_ = nullptr;
    unsigned int sampleRate_ = 0;
    unsigned int channels_ = 0;
    unsigned int periodFrames_ = 0;
    snd_pcm_uframes_t bufferFrames_ = 0;
    std::vector<float> period_;
    unsigned int xruns_ = 0;
};

} // namespace alsa

#endif // ALSA_PCM_OUT_HPP
