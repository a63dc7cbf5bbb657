#include <alsa_pcm_out.hpp>
#include <command_interpreter.hpp>
#include <console_line_in.hpp>
#include <engine_config.hpp>
#include <filesystem_preset_storage.hpp>
#include <synth_engine.hpp>
#include <log.hpp>
#include <csignal>
#include <atomic>
#include <memory>

std::atomic<bool> running(true);

void signalHandler(int /*signum*/) {
    running = false;
}

int app_main(const char* configPath) {
    try {
        logInfo("Harmonia Synthesizer - Linux");
        logInfo("============================");

        platform::EngineConfig config;
        if (configPath != nullptr && !platform::loadEngineConfig(configPath, config)) {
            logError("Using default settings");
        }

        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        logInfo("\nInitializing audio output...");
        alsa::PcmSettings pcmSettings;
        pcmSettings.device = config.device;
        pcmSettings.sampleRate = config.sampleRate;
        pcmSettings.channels = config.channels;
        pcmSettings.periodFrames = config.bufferFrames;
        alsa::AlsaPcmOut audioSink(pcmSettings);
        logInfo("Audio: %u Hz, %u channels, %u frames/period, %lu frames buffered",
                audioSink.getSampleRate(),
                audioSink.getChannels(),
                audioSink.getPeriodFrames(),
                audioSink.getBufferFrames());

        // The engine renders at whatever rate the device accepted
        config.sampleRate = audioSink.getSampleRate();
        config.channels = audioSink.getChannels();

        std::unique_ptr<features::PresetStorage> presetStorage;
        if (!config.presetFile.empty()) {
            presetStorage = std::make_unique<features::FilesystemPresetStorage>(config.presetFile);
        }
        engine::SynthEngine synth(config, std::move(presetStorage));
        synth.init();

        platform::CommandInterpreter interpreter(synth);
        platform::ConsoleLineIn console;

        logInfo("\nType commands (on 60, off 60, all, preset organ, presets, reverb 0.3,");
        logInfo("volume 0.8, log voices.txt, clearlog, count, quit). Ctrl+C to stop.");

        while (running) {
            audioSink.playPeriod([&](float* buffer, unsigned int numFrames) {
                console.pollAndRead([&](const std::string& line) {
                    platform::CommandInterpreter::Result result = interpreter.execute(line);
                    if (!result.ok) {
                        logError("%s", result.reply.c_str());
                    } else if (!result.reply.empty()) {
                        logInfo("%s", result.reply.c_str());
                    }
                    if (result.quit) {
                        running = false;
                    }
                });

                synth.renderAudio(buffer, numFrames);
            });
        }

        synth.shutdown();
        logInfo("\nPlayback stopped (%u xruns).", audioSink.getXruns());
        return 0;

    } catch (const std::exception& e) {
        logError("Error: %s", e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
    const char* configPath = (argc > 1) ? argv[1] : nullptr;
    return app_main(configPath);
}
