#pragma once

#include <synth_engine.hpp>
#include <log.hpp>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <sstream>
#include <string>

namespace platform {

/**
 * @brief Maps console text commands onto engine calls
 *
 *   on <note> [velocity]   play a note (number or name like C#4)
 *   off <note>             release a note
 *   all                    release every note
 *   preset <id>            select instrument
 *   presets                list instruments
 *   reverb <mix>           wet amount 0..1
 *   volume <gain>          master gain
 *   log <path>             write the voice log
 *   clearlog               clear the voice log
 *   count                  voice and log counts
 *   quit                   leave the player
 */
class CommandInterpreter {
public:
    struct Result {
        bool ok = true;
        bool quit = false;
        std::string reply;
    };

    explicit CommandInterpreter(engine::SynthEngine& engine)
        : engine_(engine) {}

    Result execute(const std::string& line) {
        std::istringstream in(line);
        std::string command;
        Result result;
        if (!(in >> command)) {
            return result;
        }

        if (command == "on") {
            std::string noteText;
            int note;
            if (!(in >> noteText) || !parseNote(noteText, note)) {
                return error("usage: on <note> [velocity]");
            }
            float velocity = 0.8f;
            std::string velocityText;
            if (in >> velocityText && !parseFloat(velocityText, velocity)) {
                return error("bad velocity '" + velocityText + "'");
            }
            engine_.playNote(note, velocity);
        } else if (command == "off") {
            std::string noteText;
            int note;
            if (!(in >> noteText) || !parseNote(noteText, note)) {
                return error("usage: off <note>");
            }
            engine_.stopNote(note);
        } else if (command == "all") {
            engine_.stopAll();
        } else if (command == "preset") {
            std::string id;
            if (!(in >> id)) {
                return error("usage: preset <id>");
            }
            engine_.setInstrument(id);
            result.reply = "instrument " + engine_.currentInstrument();
        } else if (command == "presets") {
            for (const auto& id : engine_.presets().ids()) {
                if (!result.reply.empty()) result.reply += ' ';
                result.reply += id;
            }
        } else if (command == "reverb" || command == "volume") {
            std::string valueText;
            float value;
            if (!(in >> valueText) || !parseFloat(valueText, value)) {
                return error("usage: " + command + " <value>");
            }
            if (command == "reverb") {
                engine_.setReverbMix(value);
            } else {
                engine_.setVolume(value);
            }
        } else if (command == "log") {
            std::string path;
            if (!(in >> path)) {
                return error("usage: log <path>");
            }
            if (!engine_.downloadLog(path)) {
                return error("could not write " + path);
            }
            result.reply = "wrote " + path;
        } else if (command == "clearlog") {
            engine_.clearLog();
        } else if (command == "count") {
            result.reply = "active " + std::to_string(engine_.activeVoiceCount()) +
                           ", rendering " + std::to_string(engine_.voiceCount()) +
                           ", log " + std::to_string(engine_.getLogCount());
        } else if (command == "quit" || command == "exit") {
            result.quit = true;
        } else {
            return error("unknown command '" + command + "'");
        }
        return result;
    }

    /**
     * @brief Parse a MIDI note number or a name such as "C4", "F#3", "Bb2"
     */
    static bool parseNote(const std::string& text, int& note) {
        if (text.empty()) {
            return false;
        }
        if (std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-') {
            char* end = nullptr;
            errno = 0;
            long value = std::strtol(text.c_str(), &end, 10);
            if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
                return false;
            }
            note = static_cast<int>(value);
            return true;
        }

        static const int PITCH_CLASS[7] = {9, 11, 0, 2, 4, 5, 7};  // A..G
        char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
        if (letter < 'A' || letter > 'G') {
            return false;
        }
        int pitchClass = PITCH_CLASS[letter - 'A'];
        size_t pos = 1;
        if (pos < text.size() && text[pos] == '#') {
            ++pitchClass;
            ++pos;
        } else if (pos < text.size() && text[pos] == 'b') {
            --pitchClass;
            ++pos;
        }
        if (pos >= text.size()) {
            return false;
        }
        char* end = nullptr;
        long octave = std::strtol(text.c_str() + pos, &end, 10);
        if (*end != '\0' || octave < MIN_OCTAVE || octave > MAX_OCTAVE) {
            return false;
        }
        note = static_cast<int>((octave + 1) * 12 + pitchClass);
        return true;
    }

private:
    static constexpr long MIN_OCTAVE = -2;
    static constexpr long MAX_OCTAVE = 10;

    static bool parseFloat(const std::string& text, float& value) {
        char* end = nullptr;
        value = std::strtof(text.c_str(), &end);
        return end != text.c_str() && *end == '\0';
    }

    static Result error(const std::string& message) {
        Result result;
        result.ok = false;
        result.reply = message;
        return result;
    }

    engine::SynthEngine& engine_;
};

} // namespace platform
