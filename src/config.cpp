#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

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

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/noisedet/noisedet.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/noisedet/noisedet.toml";
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

static std::optional<int> as_int(const string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<bool> as_bool(const string& s) {
    if (ieq(s, "true") || ieq(s,"yes") || s=="1") return true;
    if (ieq(s, "false")|| ieq(s,"no")  || s=="0") return false;
    return std::nullopt;
}

// Bad values keep whatever was there before.
template <typename T>
static void set_if(std::optional<T>& slot, const std::optional<T>& v) {
    if (v) slot = v;
}

// Returns false for unknown keys.
static bool assign_key(AppConfig& cfg, const string& key, const string& val) {
    if (ieq(key, "ffmpeg_path") || ieq(key, "ffmpeg")) cfg.ffmpeg_path = expand_path(val);
    else if (ieq(key, "storage_root")) cfg.storage_root = expand_path(val);
    else if (ieq(key, "staging_dir")) cfg.staging_dir = expand_path(val);
    else if (ieq(key, "stage_objects") || ieq(key, "stage")) set_if(cfg.stage_objects, as_bool(val));
    else if (ieq(key, "timeout_ms") || ieq(key, "timeout")) {
        auto t = as_int(val);
        if (t && *t > 0) cfg.timeout_ms = t;
    }
    else if (ieq(key, "verbose")) set_if(cfg.verbose, as_bool(val));
    else return false;
    return true;
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    while (std::getline(f, line)) {
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
        if (key.empty() || val.empty()) continue;

        if (!assign_key(cfg, key, unquote(val))) {
            std::cerr << "Warning: unknown config key '" << key << "' in " << path << "\n";
        }
    }
    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    static const struct { const char* env; const char* key; } vars[] = {
        {"NOISEDET_FFMPEG_PATH",   "ffmpeg_path"},
        {"NOISEDET_STORAGE_ROOT",  "storage_root"},
        {"NOISEDET_STAGING_DIR",   "staging_dir"},
        {"NOISEDET_STAGE_OBJECTS", "stage_objects"},
        {"NOISEDET_TIMEOUT_MS",    "timeout_ms"},
        {"NOISEDET_VERBOSE",       "verbose"},
    };
    for (const auto& v : vars) {
        const char* value = std::getenv(v.env);
        if (!value || !*value) continue;
        string s = value;
        trim_inplace(s);
        if (!s.empty()) assign_key(cfg, v.key, s);
    }
}
