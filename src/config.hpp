#pragma once
#include <optional>
#include <string>

struct AppConfig {
    std::optional<std::string> ffmpeg_path;    // --ffmpeg
    std::optional<std::string> storage_root;   // --storage-root
    std::optional<std::string> staging_dir;    // --staging-dir
    std::optional<bool> stage_objects;         // --stage / --no-stage
    std::optional<int> timeout_ms;             // --timeout-ms
    std::optional<bool> verbose;               // -v / --verbose
};

// Returns $XDG_CONFIG_HOME/noisedet/noisedet.toml or ~/.config/noisedet/noisedet.toml
std::string default_config_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// NOISEDET_FFMPEG_PATH, NOISEDET_STORAGE_ROOT, NOISEDET_STAGING_DIR,
// NOISEDET_STAGE_OBJECTS, NOISEDET_TIMEOUT_MS, NOISEDET_VERBOSE.
// Set variables override what is already in cfg.
void apply_env_overrides(AppConfig& cfg);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);
