#pragma once

#include "app/app_config.hpp"
#include "core/log.hpp"

#include <atomic>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace whispercore {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;

struct CliArgs {
    std::optional<std::string> audio_path;
    std::optional<std::string> config_path;
    std::optional<std::string> model_path;
    EngineOverrides engine;

    // microphone
    std::optional<double> record_seconds;
    std::optional<int> input_device;
    std::optional<std::string> save_recording;
    bool list_devices = false;

    // output / history
    bool json = false;
    std::optional<std::string> db_path;
    bool no_db = false;
    std::optional<int> history;
    std::optional<LogLevel> log_level;
    bool help = false;
};

// args excludes the program name. Throws std::invalid_argument on unknown
// options and missing or malformed values.
CliArgs parse_cli_args(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

// whispercore-cli entry point. Returns kExitSuccess or kExitFailure.
// `stop` ends a microphone recording early.
int run_cli(const std::vector<std::string>& args, const std::atomic<bool>& stop);

} // namespace whispercore
