#include <unity.h>
#include <effects_bus.hpp>
#include <partitioned_convolver.hpp>
#include <cmath>
#include <vector>

static const float SAMPLE_RATE = 8000.0f;
static const unsigned int BLOCK = 128;

void setUp(void) {}

void tearDown(void) {}

void test_impulseResponse_shouldBeStereoAndDecay(void) {
    synth::ImpulseResponseGenerator generator(42);
    synth::ImpulseResponse ir = generator.generate(SAMPLE_RATE);

    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(ir.channels.size()));
    TEST_ASSERT_EQUAL_UINT_MESSAGE(9600, ir.length(), "Length is floor(1.2 * sampleRate)");
    TEST_ASSERT_EQUAL_FLOAT(SAMPLE_RATE, ir.sampleRate);

    // Energy of the first tenth against the last tenth
    const size_t tenth = ir.length() / 10;
    float head = 0.0f;
    float tail = 0.0f;
    for (size_t i = 0; i < tenth; ++i) {
        head += ir.channels[0][i] * ir.channels[0][i];
        tail += ir.channels[0][ir.length() - tenth + i] * ir.channels[0][ir.length() - tenth + i];
    }
    TEST_ASSERT_TRUE_MESSAGE(head > tail * 100.0f, "Response decays over its length");

    for (float s : ir.channels[1]) {
        TEST_ASSERT_TRUE(std::fabs(s) <= 1.3f);
    }
}

void test_impulseResponse_channelsShouldBeDecorrelated(void) {
    synth::ImpulseResponseGenerator generator(42);
    synth::ImpulseResponse ir = generator.generate(SAMPLE_RATE);

    int differing = 0;
    for (size_t i = 0; i < ir.length(); ++i) {
        if (ir.channels[0][i] != ir.channels[1][i]) {
            ++differing;
        }
    }
    TEST_ASSERT_TRUE(differing > static_cast<int>(ir.length() / 2));
}

void test_normalizationScale_shouldFollowPowerAndRate(void) {
    synth::ImpulseResponse ir;
    ir.sampleRate = 44100.0f;
    ir.channels.assign(2, std::vector<float>(1000, 0.5f));

    // RMS 0.5 -> 2, times 10^(-58/20)
    float expected = 2.0f * std::pow(10.0f, -2.9f);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, expected, synth::ConvolutionReverb::normalizationScale(ir));

    ir.sampleRate = 22050.0f;
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, expected * 2.0f, synth::ConvolutionReverb::normalizationScale(ir));

    synth::ImpulseResponse silent;
    silent.sampleRate = 44100.0f;
    silent.channels.assign(2, std::vector<float>(100, 0.0f));
    float floorScale = std::pow(10.0f, -2.9f) / synth::ConvolutionReverb::MIN_POWER;
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-4f, floorScale, synth::ConvolutionReverb::normalizationScale(silent),
        "Silent response uses the power floor");
}

void test_partitionedConvolver_impulse_shouldReproduceResponse(void) {
    std::vector<float> response = {1.0f, 0.5f, 0.25f, 0.125f, 0.0f, -0.5f, 0.0f, 0.75f, 0.3f, 0.2f};
    synth::PartitionedConvolver convolver;
    convolver.configure(response, 4);
    TEST_ASSERT_EQUAL_UINT(3, convolver.partitionCount());

    std::vector<float> output;
    float in[4] = {1.0f, 0.0f, 0.0f, 0.0f};
    float out[4];
    for (int block = 0; block < 4; ++block) {
        convolver.process(in, out);
        output.insert(output.end(), out, out + 4);
        in[0] = 0.0f;
    }

    for (size_t i = 0; i < output.size(); ++i) {
        float expected = i < response.size() ? response[i] : 0.0f;
        TEST_ASSERT_FLOAT_WITHIN(1e-4f, expected, output[i]);
    }
}

void test_reverbMix_dryAndWetShouldSumToOne(void) {
    synth::EffectsBus bus(SAMPLE_RATE, BLOCK, 1.0f, 0.2f, 7);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.8f, bus.dryGain());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.2f, bus.wetGain());

    const float mixes[] = {0.0f, 0.13f, 0.5f, 0.77f, 1.0f};
    for (float mix : mixes) {
        bus.setReverbMix(mix);
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, mix, bus.wetGain());
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, bus.dryGain() + bus.wetGain());
    }

    bus.setReverbMix(1.7f);
    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(1.0f, bus.wetGain(), "Mix clamped to 1");
    bus.setReverbMix(-0.4f);
    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(0.0f, bus.wetGain(), "Mix clamped to 0");
    TEST_ASSERT_EQUAL_FLOAT(1.0f, bus.dryGain());
}

void test_volume_shouldClampNegativeAndSilence(void) {
    synth::EffectsBus bus(SAMPLE_RATE, BLOCK, 1.0f, 0.3f, 7);
    bus.setVolume(-2.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, bus.masterGain());

    float left[BLOCK];
    float right[BLOCK];
    for (int block = 0; block < 10; ++block) {
        for (unsigned int i = 0; i < BLOCK; ++i) {
            left[i] = 0.5f;
            right[i] = -0.5f;
        }
        bus.process(left, right);
        for (unsigned int i = 0; i < BLOCK; ++i) {
            TEST_ASSERT_EQUAL_FLOAT(0.0f, left[i]);
            TEST_ASSERT_EQUAL_FLOAT(0.0f, right[i]);
        }
    }
}

void test_dryOnly_shouldPassSignalThroughCompressor(void) {
    synth::EffectsBus bus(SAMPLE_RATE, BLOCK, 1.0f, 0.0f, 7);

    // Quiet input stays below the knee and only receives makeup gain
    float makeup = std::pow(10.0f, bus.compressor().getMakeupDb() / 20.0f);
    float left[BLOCK];
    float right[BLOCK];
    for (unsigned int i = 0; i < BLOCK; ++i) {
        left[i] = 0.001f;
        right[i] = 0.001f;
    }
    bus.process(left, right);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.001f * makeup, left[BLOCK - 1]);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.001f * makeup, right[BLOCK - 1]);
}

void test_wetOnly_impulse_shouldProduceReverbTail(void) {
    synth::EffectsBus bus(SAMPLE_RATE, BLOCK, 1.0f, 1.0f, 7);

    float left[BLOCK] = {0};
    float right[BLOCK] = {0};
    left[0] = 1.0f;
    right[0] = 1.0f;
    bus.process(left, right);

    float energy = 0.0f;
    for (int block = 0; block < 20; ++block) {
        for (unsigned int i = 0; i < BLOCK; ++i) {
            left[i] = 0.0f;
            right[i] = 0.0f;
        }
        bus.process(left, right);
        for (unsigned int i = 0; i < BLOCK; ++i) {
            energy += left[i] * left[i] + right[i] * right[i];
        }
    }
    TEST_ASSERT_TRUE_MESSAGE(energy > 0.0f, "Reverb tail continues after the impulse");
}

void test_compressor_shouldReduceLoudInput(void) {
    synth::DynamicsCompressor compressor(SAMPLE_RATE, synth::EffectsBus::busCompressorSettings());
    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-3f, 9.0f, compressor.getMakeupDb(), "Makeup is 0.6 of the 0 dB reduction");
    TEST_ASSERT_EQUAL_FLOAT(0.0f, compressor.computeGainDb(-40.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, -15.0f, compressor.computeGainDb(0.0f));

    float left[BLOCK];
    float right[BLOCK];
    float outputPeak = 0.0f;
    for (int block = 0; block < 40; ++block) {
        for (unsigned int i = 0; i < BLOCK; ++i) {
            float s = std::sin(6.2831853f * 200.0f * (block * BLOCK + i) / SAMPLE_RATE);
            left[i] = s;
            right[i] = s;
        }
        compressor.process(left, right, BLOCK);
        if (block == 39) {
            for (unsigned int i = 0; i < BLOCK; ++i) {
                outputPeak = std::fmax(outputPeak, std::fabs(left[i]));
            }
        }
    }
    TEST_ASSERT_TRUE_MESSAGE(compressor.getReductionDb() > 8.0f, "Full-scale input is compressed");
    TEST_ASSERT_TRUE_MESSAGE(outputPeak < 0.8f, "Compressed output peak stays below input peak");
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_impulseResponse_shouldBeStereoAndDecay);
    RUN_TEST(test_impulseResponse_channelsShouldBeDecorrelated);
    RUN_TEST(test_normalizationScale_shouldFollowPowerAndRate);
    RUN_TEST(test_partitionedConvolver_impulse_shouldReproduceResponse);
    RUN_TEST(test_reverbMix_dryAndWetShouldSumToOne);
    RUN_TEST(test_volume_shouldClampNegativeAndSilence);
    RUN_TEST(test_dryOnly_shouldPassSignalThroughCompressor);
    RUN_TEST(test_wetOnly_impulse_shouldProduceReverbTail);
    RUN_TEST(test_compressor_shouldReduceLoudInput);
    return UNITY_END();
}

extern "C" {
#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
}
