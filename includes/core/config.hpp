#pragma once
#include <optional>
#include <string>
#include <vector>

namespace wakescribe {

// One layer of configuration (file or command line). Disengaged = not given.
struct AppConfig {
    std::optional<std::vector<std::string>> wake_words; // wake_words = a, b, c
    std::optional<std::string> output_dir;              // --output-dir
    std::optional<int> silence_timeout_ms;              // --silence-ms
    std::optional<int> hard_timeout_ms;                 // --hard-timeout-ms
    std::optional<int> sample_rate;                     // --sr
    std::optional<unsigned long> frames_per_buffer;     // --fpb
    std::optional<std::string> device;                  // -d / --device (index or name)
    std::optional<std::string> model_path;              // --model

    std::optional<int> window_ms;
    std::optional<int> score_interval_ms;
    std::optional<float> wake_threshold;                // --threshold
    std::optional<int> idle_reset_ms;

    std::optional<float> vad_attack;
    std::optional<float> vad_release;
    std::optional<int> vad_hang_ms;

    std::optional<std::string> db_path;                 // --db ("" disables the journal)
    std::optional<std::string> log_file;                // --log-file

    std::optional<int> max_stream_errors;
    std::optional<int> max_reopen_attempts;
};

// Fully resolved settings with defaults applied.
struct Settings {
    std::vector<std::string> wake_words{"hey computer", "wake up", "listen", "start"};
    std::string output_dir;
    int silence_timeout_ms = 2000;
    int hard_timeout_ms = 30000;
    int sample_rate = 16000;
    unsigned long frames_per_buffer = 1600; // 100 ms @ 16k
    std::optional<std::string> device;
    std::string model_path;                 // empty = search default locations

    int window_ms = 1500;
    int score_interval_ms = 250;
    float wake_threshold = 0.8f;
    int idle_reset_ms = 3000;

    float vad_attack = -40.0f;
    float vad_release = -50.0f;
    int vad_hang_ms = 300;

    std::string db_path;
    std::string log_file;

    int max_stream_errors = 5;
    int max_reopen_attempts = 10;
};

// Returns $XDG_CONFIG_HOME/wakescribe or ~/.config/wakescribe
std::string default_config_dir();

// default_config_dir() + "/wakescribe.conf"
std::string default_config_path();

// Returns $XDG_DATA_HOME/wakescribe/sessions.db or ~/.local/share/wakescribe/sessions.db
std::string default_db_path();

// Load config file if it exists. Simple key = value, '#' or ';' comments,
// optionally quoted strings. Missing file returns an empty AppConfig.
// Throws ConfigError for a value that does not parse.
AppConfig load_config_file(const std::string& path);

// Fields engaged in `overrides` replace those in `base`.
void merge_config(AppConfig& base, const AppConfig& overrides);

// Apply defaults and validate. Throws ConfigError.
Settings resolve_settings(const AppConfig& cfg);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Split a comma-separated list, trimming each item and dropping empty ones.
std::vector<std::string> split_list(const std::string& s);

} // namespace wakescribe
