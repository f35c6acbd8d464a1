#include "asr/vosk_asr.hpp"
#include "audio/framer.hpp"
#include "audio/portaudio_source.hpp"
#include "core/audio_settings.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "service/console_control.hpp"
#include "service/service.hpp"
#include "service/signal_control.hpp"
#include "session/hook_dispatcher.hpp"
#include "session/notification.hpp"
#include "session/session_journal.hpp"
#include "session/session_state_machine.hpp"
#include "transcript/transcript_writer.hpp"
#include "wake/wake_word_spec.hpp"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace wakescribe;

namespace fs = std::filesystem;

namespace {

struct Args {
    std::string config_path;
    AppConfig overrides;

    bool list_devices = false;
    std::optional<std::string> save_device;
    std::optional<int> history;
    bool verbose = false;
    bool no_console = false;
};

void print_usage() {
    std::cout << "wakescribe - wake word gated transcription\n"
              << "  -c, --config <path>          Config file (default " << default_config_path() << ")\n"
              << "  -k, --keywords <a,b,...>     Wake words (default: hey computer, wake up, listen, start)\n"
              << "  -o, --output-dir <dir>       Transcript directory (default ~/stt_transcripts)\n"
              << "  -m, --model <path>           Vosk model directory\n"
              << "  -d, --device <index|name>    Input device\n"
              << "      --sr <Hz>                Sample rate (default 16000)\n"
              << "      --fpb <frames>           Frames per buffer (default 1600)\n"
              << "      --silence-ms <ms>        End a session after this much silence (default 2000)\n"
              << "      --hard-timeout-ms <ms>   Maximum session length (default 30000)\n"
              << "      --threshold <0..1>       Wake word confidence threshold (default 0.8)\n"
              << "      --db <path>              Session journal, \"\" disables (default XDG)\n"
              << "      --log-file <path>        Also append log lines to this file\n"
              << "  -v, --verbose                Debug logging\n"
              << "  -l, --list-devices           List input devices\n"
              << "      --save-device <sel>      Remember an input device and exit\n"
              << "      --history <N>            Print the last N sessions and exit\n"
              << "      --no-console             Disable p/s/q key controls\n"
              << "Signals: SIGINT/SIGTERM stop, SIGUSR1 pause/resume, SIGHUP reopen files, SIGUSR2 status\n";
}

Args parse_args(int argc, char** argv) {
    Args a{};
    a.config_path = default_config_path();

    auto need = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw ConfigError(flag + " needs a value");
        return argv[++i];
    };
    auto as_int = [](const std::string& flag, const std::string& v) -> int {
        try { return std::stoi(v); } catch (const std::exception&) {
            throw ConfigError(flag + " expects an integer, got '" + v + "'");
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        AppConfig& o = a.overrides;
        if      (s == "--config" || s == "-c") a.config_path = expand_path(need(i, s));
        else if (s == "--keywords" || s == "-k") o.wake_words = split_list(need(i, s));
        else if (s == "--output-dir" || s == "-o") o.output_dir = expand_path(need(i, s));
        else if (s == "--model" || s == "-m") o.model_path = expand_path(need(i, s));
        else if (s == "--device" || s == "-d") o.device = need(i, s);
        else if (s == "--sr") o.sample_rate = as_int(s, need(i, s));
        else if (s == "--fpb" || s == "--frames") {
            int v = as_int(s, need(i, s));
            if (v <= 0) throw ConfigError("--fpb must be positive");
            o.frames_per_buffer = static_cast<unsigned long>(v);
        }
        else if (s == "--silence-ms") o.silence_timeout_ms = as_int(s, need(i, s));
        else if (s == "--hard-timeout-ms") o.hard_timeout_ms = as_int(s, need(i, s));
        else if (s == "--threshold") {
            std::string v = need(i, s);
            try { o.wake_threshold = std::stof(v); } catch (const std::exception&) {
                throw ConfigError("--threshold expects a number, got '" + v + "'");
            }
        }
        else if (s == "--db") o.db_path = expand_path(need(i, s));
        else if (s == "--log-file") o.log_file = expand_path(need(i, s));
        else if (s == "--verbose" || s == "-v") a.verbose = true;
        else if (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if (s == "--save-device") a.save_device = need(i, s);
        else if (s == "--history") {
            int n = as_int(s, need(i, s));
            if (n <= 0) throw ConfigError("--history must be positive");
            a.history = n;
        }
        else if (s == "--no-console") a.no_console = true;
        else if (s == "--help" || s == "-h") {
            print_usage();
            std::exit(kExitOk);
        }
        else throw ConfigError("unknown option: " + s);
    }
    return a;
}

// Explicit path, else ./model, else the small English model next to the binary's cwd.
std::string resolve_model_path(const std::string& configured) {
    if (!configured.empty()) return configured;
    for (const char* candidate : {"model", "vosk-model-small-en-us-0.15"}) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) return candidate;
    }
    throw ModelUnavailable("no Vosk model found; pass --model <dir> or unpack one into ./model");
}

std::string format_ms(std::int64_t ms) {
    if (ms <= 0) return "-";
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

int print_history(const Settings& settings, int limit) {
    if (settings.db_path.empty()) {
        std::cerr << "Session journal is disabled (db_path is empty)\n";
        return kExitConfig;
    }
    SessionJournal journal(settings.db_path);
    auto rows = journal.recent(limit);
    if (rows.empty()) {
        std::cout << "No sessions recorded in " << settings.db_path << "\n";
        return kExitOk;
    }
    for (const auto& r : rows) {
        std::cout << "#" << r.sessionId << "  " << format_ms(r.startedMs)
                  << "  \"" << r.keyword << "\" (" << std::fixed << std::setprecision(2)
                  << r.confidence << ")  " << (r.reason.empty() ? "open" : r.reason)
                  << " / " << (r.outcome.empty() ? "-" : r.outcome)
                  << ", " << r.textChars << " chars\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    Settings settings;
    try {
        args = parse_args(argc, argv);
        AppConfig cfg = load_config_file(args.config_path);
        merge_config(cfg, args.overrides);
        settings = resolve_settings(cfg);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitConfig;
    }

    Log::setLevel(args.verbose ? Log::Level::Debug : Log::Level::Info);
    if (!settings.log_file.empty() && !Log::setFile(settings.log_file)) {
        Log::warn("Main", "Cannot open log file " + settings.log_file + ", logging to stderr only");
    }

    try {
        if (args.history) {
            return print_history(settings, *args.history);
        }

        PortAudioSource source({
            .sampleRate = settings.sample_rate,
            .framesPerBuffer = settings.frames_per_buffer,
        });

        if (args.list_devices) {
            for (const auto& d : source.listDevices()) std::cout << PortAudioSource::describe(d) << "\n";
            return kExitOk;
        }

        const std::string audioSettingsPath = default_audio_settings_path();
        if (args.save_device) {
            auto devices = source.listDevices();
            int index = resolveDeviceSelector(devices, args.save_device, Pa_GetDefaultInputDevice());
            AudioSettings saved{.inputDevice = index};
            for (const auto& d : devices) {
                if (d.index == index) saved.deviceName = d.name;
            }
            if (!saveAudioSettings(audioSettingsPath, saved)) {
                std::cerr << "Failed to write " << audioSettingsPath << "\n";
                return kExitConfig;
            }
            std::cout << "Saved input device [" << index << "] " << saved.deviceName
                      << " to " << audioSettingsPath << "\n";
            return kExitOk;
        }

        if (!settings.device) {
            if (auto saved = loadAudioSettings(audioSettingsPath)) {
                settings.device = savedDeviceSelector(source.listDevices(), saved->inputDevice,
                                                      saved->deviceName);
                Log::info("Main", "Using saved input device " + *settings.device);
            }
        }

        WakeWordSpec spec(settings.wake_words);

        const std::string modelPath = resolve_model_path(settings.model_path);
        Log::info("Main", "Loading Vosk model from " + modelPath);
        VoskASR recognizer({
            .modelPath = modelPath,
            .sampleRate = static_cast<float>(settings.sample_rate),
        });

        TranscriptWriter writer(settings.output_dir);

        HookDispatcher hooks;
        hooks.addSink(std::make_shared<LoggingSink>());
        if (!settings.db_path.empty()) {
            try {
                hooks.addSink(std::make_shared<SessionJournal>(settings.db_path));
            } catch (const std::runtime_error& e) {
                Log::warn("Main", std::string("Session journal disabled: ") + e.what());
            }
        }
        hooks.start();

        Framer framer(settings.sample_rate, settings.window_ms);

        SessionStateMachine::Config smConfig;
        smConfig.silenceTimeoutMs = settings.silence_timeout_ms;
        smConfig.hardTimeoutMs = settings.hard_timeout_ms;
        smConfig.scoreIntervalMs = settings.score_interval_ms;
        smConfig.sampleRate = settings.sample_rate;
        smConfig.detector.threshold = settings.wake_threshold;
        smConfig.detector.idleResetMs = settings.idle_reset_ms;
        smConfig.vad.attackDb = settings.vad_attack;
        smConfig.vad.releaseDb = settings.vad_release;
        smConfig.vad.hangoverMs = settings.vad_hang_ms;
        SessionStateMachine machine(smConfig, spec, recognizer, writer, hooks);

        Service::Config serviceConfig;
        serviceConfig.deviceSelector = settings.device;
        serviceConfig.maxStreamErrors = settings.max_stream_errors;
        serviceConfig.maxReopenAttempts = settings.max_reopen_attempts;
        Service service(serviceConfig, source, framer, machine, writer, hooks);

        Log::info("Main", "Transcripts: " + writer.outputDir());

        try {
            service.start();
        } catch (const DeviceUnavailable& e) {
            Log::error("Main", std::string("Audio device unavailable: ") + e.what());
            hooks.stop();
            return kExitDeviceUnavailable;
        }

        SignalControl signals(service);
        signals.start();

        ConsoleControl console(service);
        if (!args.no_console && console.usable()) console.start();

        int code = service.run();

        console.stop();
        signals.stop();
        hooks.stop();
        if (hooks.dropped() > 0) {
            Log::warn("Main", std::to_string(hooks.dropped()) + " notifications dropped");
        }
        return code;
    } catch (const ConfigError& e) {
        Log::error("Main", std::string("Configuration error: ") + e.what());
        return kExitConfig;
    } catch (const ModelUnavailable& e) {
        Log::error("Main", std::string("Model unavailable: ") + e.what());
        return kExitModelUnavailable;
    } catch (const DeviceUnavailable& e) {
        Log::error("Main", std::string("Audio device unavailable: ") + e.what());
        return kExitDeviceUnavailable;
    } catch (const std::exception& e) {
        Log::error("Main", std::string("Error: ") + e.what());
        return kExitConfig;
    }
}
