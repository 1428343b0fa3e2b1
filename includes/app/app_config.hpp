#pragma once

#include "core/configuration.hpp"
#include "core/log.hpp"

#include <optional>
#include <string>
#include <utility>

namespace whispercore {

// Defaults for whispercore-cli, read from a key = value file.
struct AppConfig {
    std::optional<std::string> model_path;     // model
    std::optional<GpuMode> gpu_mode;           // gpu_mode
    std::optional<int> gpu_device;             // gpu_device
    std::optional<bool> flash_attention;       // flash_attention
    std::optional<int> threads;                // threads
    std::optional<std::string> language;       // language
    std::optional<bool> translate;             // translate

    std::optional<std::string> db_path;        // db_path
    std::optional<int> input_device;           // input_device
    std::optional<LogLevel> log_level;         // log_level

    // Overlays the engine-related keys that are set.
    void apply_to(Configuration& config) const;
};

// Engine settings given on the command line.
struct EngineOverrides {
    std::optional<GpuMode> gpu_mode;           // --gpu
    std::optional<int> gpu_device;             // --gpu-device
    std::optional<bool> flash_attention;       // --no-flash-attn
    std::optional<int> threads;                // -t
    std::optional<std::string> language;       // -l
    std::optional<bool> translate;             // --translate

    void apply_to(Configuration& config) const;
};

// Command line wins over the file, the file wins over built-in defaults.
Configuration resolve_configuration(const AppConfig& file, const EngineOverrides& cli);

// Returns $XDG_CONFIG_HOME/whispercore/whispercore.toml or ~/.config/whispercore/whispercore.toml
std::string default_config_path();

// One "key = value" (or "key: value") line with comments stripped and the
// value unquoted. nullopt for blank, comment-only or malformed lines.
std::optional<std::pair<std::string, std::string>> parse_config_line(const std::string& line);

// Comments start with '#' or ';'. Unknown keys and unparseable values are
// skipped. Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

} // namespace whispercore
