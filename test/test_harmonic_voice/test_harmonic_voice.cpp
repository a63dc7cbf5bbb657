#include <unity.h>
#define ENABLE_MEMORY_TRACKING
#include "memory_tracker.hpp"
#include <voice_builder.hpp>
#include <pitch.hpp>
#include <preset_catalog.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

static const float SAMPLE_RATE = 16000.0f;

static presets::Preset plainPreset() {
    presets::Preset p;
    p.id = "plain";
    p.name = "Plain";
    p.harmonics = {1.0f, 0.5f, 0.25f};
    p.attack = 0.01f;
    p.decay = 0.5f;
    p.sustain = 0.5f;
    p.release = 0.5f;
    p.filterCutoff = 4000.0f;
    p.filterQ = 0.7f;
    p.filterEnvelope = 0.5f;
    return p;
}

void setUp(void) {}

void tearDown(void) {}

void test_partialGains_shouldFollowRolloff(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 1234);
    presets::Preset preset = plainPreset();
    auto voice = builder.build(60, 0.8f, preset, 0.0);

    std::vector<float> gains = voice->partialGains();
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(gains.size()));
    for (size_t i = 0; i < gains.size(); ++i) {
        float expected = preset.harmonics[i] * std::pow(0.85f, static_cast<float>(i)) * 0.3f;
        TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-6f, expected, gains[i], "Gain is a * 0.85^i * 0.3");
    }

    std::vector<float> freqs = voice->partialFrequencies();
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 261.63f, freqs[0]);
    TEST_ASSERT_FLOAT_WITHIN(0.02f, 2.0f * 261.63f, freqs[1]);
}

void test_partials_aboveNyquistOrSilent_shouldBeSkipped(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 1234);
    presets::Preset preset = plainPreset();
    preset.harmonics = {1.0f, 0.0f, 0.5f, 0.5f, 0.5f, 0.5f, 0.5f, 0.5f, 0.5f, 0.5f};

    // A5 = 880 Hz; Nyquist at 8000 Hz admits harmonics up to 9
    auto voice = builder.build(81, 1.0f, preset, 0.0);
    std::vector<float> freqs = voice->partialFrequencies();
    TEST_ASSERT_EQUAL_INT_MESSAGE(8, static_cast<int>(freqs.size()),
        "Harmonic 2 is silent and harmonic 10 is above Nyquist");
    for (float f : freqs) {
        TEST_ASSERT_TRUE(f <= SAMPLE_RATE / 2.0f);
    }
    TEST_ASSERT_FLOAT_WITHIN(0.05f, 3.0f * 880.0f, freqs[1]);
}

void test_detune_shouldStayWithinHalfSpread(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 99);
    presets::Preset preset = plainPreset();
    preset.detuneSpread = 10.0f;

    for (int n = 0; n < 20; ++n) {
        auto voice = builder.build(48 + n, 0.5f, preset, 0.0);
        for (float detune : voice->partialDetunes()) {
            TEST_ASSERT_TRUE_MESSAGE(std::fabs(detune) <= 5.0f, "Detune within +/- spread/2");
        }
    }
}

void test_filterEnvelope_shouldStartOpenAndSettle(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 1);
    presets::Preset preset = plainPreset();
    auto voice = builder.build(60, 0.8f, preset, 1.0);

    TEST_ASSERT_FLOAT_WITHIN(0.5f, 6000.0f, voice->filterFrequency().valueAt(1.0));
    double settle = 1.0 + preset.attack + preset.decay * 0.5;
    TEST_ASSERT_FLOAT_WITHIN(0.5f, 4000.0f, voice->filterFrequency().valueAt(settle));

    preset.filterCutoff = 12000.0f;
    preset.filterEnvelope = 1.0f;
    auto bright = builder.build(60, 0.8f, preset, 0.0);
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(0.5f, 15000.0f, bright->filterFrequency().valueAt(0.0),
        "Filter start capped at 15 kHz");
}

void test_mainGain_shouldFollowAttackDecaySustain(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 1);
    presets::Preset preset = plainPreset();
    auto voice = builder.build(60, 0.8f, preset, 0.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.0001f, voice->mainGain().valueAt(0.0));
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-3f, 0.4f, voice->mainGain().valueAt(preset.attack),
        "Peak reached at end of attack");

    float midAttack = voice->mainGain().valueAt(preset.attack * 0.5);
    TEST_ASSERT_TRUE(midAttack > 0.15f && midAttack < 0.25f);

    double late = preset.attack + preset.decay * 0.3 * 12.0;
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-3f, 0.2f, voice->mainGain().valueAt(late),
        "Decays toward peak * sustain");
}

void test_optionalStages_shouldFollowPreset(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 5);
    presets::Preset preset = plainPreset();

    auto plain = builder.build(60, 0.8f, preset, 0.0);
    TEST_ASSERT_FALSE(plain->hasVibrato());
    TEST_ASSERT_FALSE(plain->hasPluckNoise());
    TEST_ASSERT_FALSE(plain->hasSaturation());
    TEST_ASSERT_FALSE(plain->hasPanner());

    preset.vibratoRate = 5.0f;
    preset.vibratoDepth = 6.0f;
    preset.pluckNoiseLevel = 0.3f;
    preset.saturationAmount = 0.2f;
    preset.stereoSpread = 0.5f;
    auto full = builder.build(60, 0.8f, preset, 0.0);
    TEST_ASSERT_TRUE(full->hasVibrato());
    TEST_ASSERT_TRUE(full->hasPluckNoise());
    TEST_ASSERT_TRUE(full->hasSaturation());
    TEST_ASSERT_TRUE(full->hasPanner());
    TEST_ASSERT_TRUE_MESSAGE(std::fabs(full->pan()) <= 0.5f, "Pan within +/- spread");

    synth::VoiceSnapshot snap = full->snapshot(0.0, false);
    TEST_ASSERT_EQUAL_INT(5, static_cast<int>(snap.extraNodes.size()));
    TEST_ASSERT_EQUAL_STRING("WaveShaper_0", snap.extraNodes[0].c_str());
    TEST_ASSERT_EQUAL_INT_MESSAGE(3, static_cast<int>(snap.oscillators.size()),
        "Only harmonic partials are listed as oscillators");
}

void test_pluckNoise_shouldDecayOverBurstAndStop(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 99);
    presets::Preset preset = plainPreset();
    preset.pluckNoiseLevel = 0.4f;
    preset.pluckNoiseDecay = 0.25f;
    auto voice = builder.build(60, 1.0f, preset, 1.0);

    const std::vector<float>& burst = voice->pluckNoise();
    TEST_ASSERT_EQUAL_INT_MESSAGE(4000, static_cast<int>(burst.size()), "0.25 s at 16 kHz");
    float loudest = 0.0f;
    for (size_t i = 0; i < burst.size(); ++i) {
        float t = static_cast<float>(i) / burst.size();
        float envelope = std::pow(1.0f - t, 3.0f);
        TEST_ASSERT_TRUE(std::fabs(burst[i]) <= envelope + 1e-6f);
        if (i < burst.size() / 10) {
            loudest = std::max(loudest, std::fabs(burst[i]));
        }
    }
    TEST_ASSERT_TRUE_MESSAGE(loudest > 0.3f, "Burst starts loud");

    const synth::AutomationParam& gain = voice->pluckNoiseGain();
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.4f, gain.valueAt(1.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, std::sqrt(0.4f * 0.0001f), gain.valueAt(1.125));
    TEST_ASSERT_FLOAT_WITHIN(1e-7f, 0.0001f, gain.valueAt(1.25));

    std::vector<float> left(128), right(128);
    unsigned int rendered = 0;
    while (rendered < 3968) {
        voice->render(left.data(), right.data(), 128, 1.0 + rendered / SAMPLE_RATE);
        rendered += 128;
    }
    TEST_ASSERT_TRUE_MESSAGE(voice->isPluckNoisePlaying(), "32 frames of burst left");
    voice->render(left.data(), right.data(), 128, 1.0 + rendered / SAMPLE_RATE);
    TEST_ASSERT_FALSE_MESSAGE(voice->isPluckNoisePlaying(), "Burst plays once");
}

void test_pluckNoise_shouldLastAtLeastFiftyMilliseconds(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 99);
    presets::Preset preset = plainPreset();
    preset.pluckNoiseLevel = 0.2f;
    preset.pluckNoiseDecay = 0.02f;
    auto voice = builder.build(60, 1.0f, preset, 0.0);

    TEST_ASSERT_EQUAL_INT(800, static_cast<int>(voice->pluckNoise().size()));
    TEST_ASSERT_FLOAT_WITHIN(1e-7f, 0.0001f, voice->pluckNoiseGain().valueAt(0.05));
}

// Frequency from linearly interpolated rising zero crossings of samples[from, to)
static float measureFrequency(const std::vector<float>& samples, size_t from, size_t to) {
    double first = -1.0;
    double last = -1.0;
    int cycles = -1;
    for (size_t i = from + 1; i < to; ++i) {
        if (samples[i - 1] < 0.0f && samples[i] >= 0.0f) {
            double crossing = (i - 1) + samples[i - 1] / (samples[i - 1] - samples[i]);
            if (first < 0.0) {
                first = crossing;
            }
            last = crossing;
            ++cycles;
        }
    }
    return static_cast<float>(cycles * SAMPLE_RATE / (last - first));
}

static std::vector<float> renderSinglePartial(int harmonic, float frequencyHz, bool vibrato) {
    synth::HarmonicVoice voice(SAMPLE_RATE, 60, "test", 0.0);
    voice.addPartial(harmonic, frequencyHz, 1.0f, 1.0f, 0.0f);
    if (vibrato) {
        // Half-hertz LFO peaks at 0.5 s
        voice.setVibrato(0.5f, 100.0f);
    }
    voice.filterFrequency().setValueAtTime(7000.0f, 0.0);
    voice.mainGain().setValueAtTime(1.0f, 0.0);

    std::vector<float> left(9600, 0.0f), right(9600, 0.0f);
    voice.render(left.data(), right.data(), 9600, 0.0);
    return left;
}

static float centsBetween(float frequency, float reference) {
    return 1200.0f * std::log2(frequency / reference);
}

void test_vibrato_shouldScaleWithHarmonicNumber(void) {
    // Around the LFO peak the modulation is nearly constant
    const size_t from = 7200;
    const size_t to = 8800;

    float plain = measureFrequency(renderSinglePartial(1, 400.0f, false), from, to);
    TEST_ASSERT_FLOAT_WITHIN(0.5f, 400.0f, plain);

    float fundamentalCents = centsBetween(measureFrequency(renderSinglePartial(1, 400.0f, true), from, to), 400.0f);
    float thirdCents = centsBetween(measureFrequency(renderSinglePartial(3, 1200.0f, true), from, to), 1200.0f);

    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(4.0f, 99.0f, fundamentalCents, "Fundamental swings by the depth");
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(12.0f, 297.0f, thirdCents, "Third harmonic swings three times as far");
    TEST_ASSERT_FLOAT_WITHIN(0.1f, 3.0f, thirdCents / fundamentalCents);
}

void test_saturationCurve_shouldBeSharedBetweenVoices(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 5);
    presets::Preset preset = plainPreset();
    preset.saturationAmount = 0.25f;

    auto a = builder.build(60, 0.8f, preset, 0.0);
    auto b = builder.build(64, 0.8f, preset, 0.0);
    TEST_ASSERT_NOT_NULL(a->saturationCurve());
    TEST_ASSERT_TRUE_MESSAGE(a->saturationCurve() == b->saturationCurve(), "Same amount reuses the curve");
    TEST_ASSERT_EQUAL_UINT(1, builder.curveCache().size());
    TEST_ASSERT_EQUAL_UINT(synth::SaturationCurveCache::CURVE_SIZE, a->saturationCurve()->size());

    preset.saturationAmount = 0.5f;
    auto c = builder.build(67, 0.8f, preset, 0.0);
    TEST_ASSERT_TRUE(a->saturationCurve() != c->saturationCurve());
    TEST_ASSERT_EQUAL_UINT(2, builder.curveCache().size());
}

void test_pan_shouldUseEqualPowerGains(void) {
    synth::HarmonicVoice voice(SAMPLE_RATE, 69, "test", 0.0);
    voice.addPartial(1, 440.0f, 1.0f, 0.3f, 0.0f);
    voice.filterFrequency().setValue(7000.0f);
    voice.mainGain().setValue(1.0f);
    voice.setPan(1.0f);

    float left[256] = {0};
    float right[256] = {0};
    voice.render(left, right, 256, 0.0);

    float leftEnergy = 0.0f;
    float rightEnergy = 0.0f;
    for (int i = 0; i < 256; ++i) {
        leftEnergy += left[i] * left[i];
        rightEnergy += right[i] * right[i];
    }
    TEST_ASSERT_TRUE_MESSAGE(rightEnergy > 0.0f, "Hard right pan sounds on the right");
    TEST_ASSERT_TRUE_MESSAGE(leftEnergy < rightEnergy * 1e-6f, "Hard right pan is silent on the left");
}

void test_render_shouldNotAllocate(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 7);
    presets::PresetCatalog catalog;
    auto voice = builder.build(60, 0.9f, catalog.resolve("epiano"), 0.0);
    auto pluck = builder.build(64, 0.9f, catalog.resolve("guitar"), 0.0);

    float left[512] = {0};
    float right[512] = {0};
    TEST_NO_HEAP_ALLOCATIONS({
        voice->render(left, right, 512, 0.0);
        pluck->render(left, right, 512, 0.0);
    });

    float peak = 0.0f;
    for (int i = 0; i < 512; ++i) {
        peak = std::max(peak, std::fabs(left[i]));
    }
    TEST_ASSERT_TRUE_MESSAGE(peak > 0.0f, "Voices produce sound");
    TEST_ASSERT_TRUE(peak < 2.0f);
}

void test_disconnect_shouldSilenceAndBeIdempotent(void) {
    synth::VoiceSynthesisBuilder builder(SAMPLE_RATE, 7);
    auto voice = builder.build(60, 0.9f, plainPreset(), 0.0);

    voice->disconnect();
    voice->disconnect();
    TEST_ASSERT_FALSE(voice->isConnected());

    float left[128] = {0};
    float right[128] = {0};
    voice->render(left, right, 128, 0.0);
    for (int i = 0; i < 128; ++i) {
        TEST_ASSERT_EQUAL_FLOAT(0.0f, left[i]);
        TEST_ASSERT_EQUAL_FLOAT(0.0f, right[i]);
    }
}

void test_pitchHelpers_shouldNameAndTuneNotes(void) {
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 440.0f, static_cast<float>(synth::midiToFrequency(69)));
    TEST_ASSERT_EQUAL_STRING("C4", synth::midiToNoteName(60).c_str());
    TEST_ASSERT_EQUAL_STRING("A#3", synth::midiToNoteName(58).c_str());
    TEST_ASSERT_EQUAL_STRING("C-1", synth::midiToNoteName(0).c_str());
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_partialGains_shouldFollowRolloff);
    RUN_TEST(test_partials_aboveNyquistOrSilent_shouldBeSkipped);
    RUN_TEST(test_detune_shouldStayWithinHalfSpread);
    RUN_TEST(test_filterEnvelope_shouldStartOpenAndSettle);
    RUN_TEST(test_mainGain_shouldFollowAttackDecaySustain);
    RUN_TEST(test_optionalStages_shouldFollowPreset);
    RUN_TEST(test_pluckNoise_shouldDecayOverBurstAndStop);
    RUN_TEST(test_pluckNoise_shouldLastAtLeastFiftyMilliseconds);
    RUN_TEST(test_vibrato_shouldScaleWithHarmonicNumber);
    RUN_TEST(test_saturationCurve_shouldBeSharedBetweenVoices);
    RUN_TEST(test_pan_shouldUseEqualPowerGains);
    RUN_TEST(test_render_shouldNotAllocate);
    RUN_TEST(test_disconnect_shouldSilenceAndBeIdempotent);
    RUN_TEST(test_pitchHelpers_shouldNameAndTuneNotes);
    return UNITY_END();
}

extern "C" {
#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
}
