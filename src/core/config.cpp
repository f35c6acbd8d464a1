#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace wakescribe {

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/wakescribe";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/wakescribe";
}

std::string default_config_path() {
    return default_config_dir() + "/wakescribe.conf";
}

std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return string(xdg) + "/wakescribe/sessions.db";
    const char* home = std::getenv("HOME");
    return string(home ? home : ".") + "/.local/share/wakescribe/sessions.db";
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == string::npos) comma = s.size();
        string item = s.substr(start, comma - start);
        trim_inplace(item);
        item = unquote(item);
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty()) continue;
        val = unquote(val);

        auto bad = [&](const char* what) {
            return ConfigError(path + ":" + std::to_string(line_no) + ": " + key +
                               " expects " + what + ", got '" + val + "'");
        };
        auto as_int = [&]() -> int {
            try { return std::stoi(val); } catch (const std::exception&) { throw bad("an integer"); }
        };
        auto as_ulong = [&]() -> unsigned long {
            try { return std::stoul(val); } catch (const std::exception&) { throw bad("an integer"); }
        };
        auto as_float = [&]() -> float {
            try { return std::stof(val); } catch (const std::exception&) { throw bad("a number"); }
        };

        if (ieq(key, "wake_words") || ieq(key, "keywords")) cfg.wake_words = split_list(val);
        else if (ieq(key, "output_dir")) cfg.output_dir = expand_path(val);
        else if (ieq(key, "silence_timeout_ms")) cfg.silence_timeout_ms = as_int();
        else if (ieq(key, "hard_timeout_ms")) cfg.hard_timeout_ms = as_int();
        else if (ieq(key, "sample_rate")) cfg.sample_rate = as_int();
        else if (ieq(key, "frames_per_buffer") || ieq(key, "fpb")) cfg.frames_per_buffer = as_ulong();
        else if (ieq(key, "device")) cfg.device = val;
        else if (ieq(key, "model_path") || ieq(key, "model")) cfg.model_path = expand_path(val);
        else if (ieq(key, "window_ms")) cfg.window_ms = as_int();
        else if (ieq(key, "score_interval_ms")) cfg.score_interval_ms = as_int();
        else if (ieq(key, "wake_threshold")) cfg.wake_threshold = as_float();
        else if (ieq(key, "idle_reset_ms")) cfg.idle_reset_ms = as_int();
        else if (ieq(key, "vad_attack")) cfg.vad_attack = as_float();
        else if (ieq(key, "vad_release")) cfg.vad_release = as_float();
        else if (ieq(key, "vad_hang_ms") || ieq(key, "vad_hang")) cfg.vad_hang_ms = as_int();
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
        else if (ieq(key, "log_file")) cfg.log_file = expand_path(val);
        else if (ieq(key, "max_stream_errors")) cfg.max_stream_errors = as_int();
        else if (ieq(key, "max_reopen_attempts")) cfg.max_reopen_attempts = as_int();
    }
    return cfg;
}

void merge_config(AppConfig& base, const AppConfig& o) {
    auto take = [](auto& dst, const auto& src) { if (src) dst = src; };
    take(base.wake_words, o.wake_words);
    take(base.output_dir, o.output_dir);
    take(base.silence_timeout_ms, o.silence_timeout_ms);
    take(base.hard_timeout_ms, o.hard_timeout_ms);
    take(base.sample_rate, o.sample_rate);
    take(base.frames_per_buffer, o.frames_per_buffer);
    take(base.device, o.device);
    take(base.model_path, o.model_path);
    take(base.window_ms, o.window_ms);
    take(base.score_interval_ms, o.score_interval_ms);
    take(base.wake_threshold, o.wake_threshold);
    take(base.idle_reset_ms, o.idle_reset_ms);
    take(base.vad_attack, o.vad_attack);
    take(base.vad_release, o.vad_release);
    take(base.vad_hang_ms, o.vad_hang_ms);
    take(base.db_path, o.db_path);
    take(base.log_file, o.log_file);
    take(base.max_stream_errors, o.max_stream_errors);
    take(base.max_reopen_attempts, o.max_reopen_attempts);
}

Settings resolve_settings(const AppConfig& cfg) {
    Settings s;
    s.output_dir = expand_path("~/stt_transcripts");
    s.db_path = default_db_path();

    if (cfg.wake_words) s.wake_words = *cfg.wake_words;
    if (cfg.output_dir) s.output_dir = *cfg.output_dir;
    s.silence_timeout_ms = cfg.silence_timeout_ms.value_or(s.silence_timeout_ms);
    s.hard_timeout_ms = cfg.hard_timeout_ms.value_or(s.hard_timeout_ms);
    s.sample_rate = cfg.sample_rate.value_or(s.sample_rate);
    s.frames_per_buffer = cfg.frames_per_buffer.value_or(s.frames_per_buffer);
    if (cfg.device && !cfg.device->empty()) s.device = cfg.device;
    if (cfg.model_path) s.model_path = *cfg.model_path;
    s.window_ms = cfg.window_ms.value_or(s.window_ms);
    s.score_interval_ms = cfg.score_interval_ms.value_or(s.score_interval_ms);
    s.wake_threshold = cfg.wake_threshold.value_or(s.wake_threshold);
    s.idle_reset_ms = cfg.idle_reset_ms.value_or(s.idle_reset_ms);
    s.vad_attack = cfg.vad_attack.value_or(s.vad_attack);
    s.vad_release = cfg.vad_release.value_or(s.vad_release);
    s.vad_hang_ms = cfg.vad_hang_ms.value_or(s.vad_hang_ms);
    if (cfg.db_path) s.db_path = *cfg.db_path;
    if (cfg.log_file) s.log_file = *cfg.log_file;
    s.max_stream_errors = cfg.max_stream_errors.value_or(s.max_stream_errors);
    s.max_reopen_attempts = cfg.max_reopen_attempts.value_or(s.max_reopen_attempts);

    if (s.wake_words.empty()) throw ConfigError("at least one wake word is required");
    if (s.output_dir.empty()) throw ConfigError("output_dir must not be empty");
    if (s.silence_timeout_ms <= 0) throw ConfigError("silence_timeout_ms must be positive");
    if (s.hard_timeout_ms < s.silence_timeout_ms)
        throw ConfigError("hard_timeout_ms must be >= silence_timeout_ms");
    if (s.sample_rate < 8000 || s.sample_rate > 48000)
        throw ConfigError("sample_rate must be within 8000..48000 Hz");
    if (s.frames_per_buffer == 0) throw ConfigError("frames_per_buffer must be positive");
    if (s.window_ms <= 0) throw ConfigError("window_ms must be positive");
    if (s.score_interval_ms < 0 || s.score_interval_ms > s.window_ms)
        throw ConfigError("score_interval_ms must be within 0..window_ms");
    if (!(s.wake_threshold > 0.0f && s.wake_threshold <= 1.0f))
        throw ConfigError("wake_threshold must be within (0, 1]");
    if (s.vad_release > s.vad_attack) throw ConfigError("vad_release must be <= vad_attack");
    if (s.max_stream_errors < 0 || s.max_reopen_attempts < 0)
        throw ConfigError("stream retry limits must not be negative");
    return s;
}

} // namespace wakescribe
