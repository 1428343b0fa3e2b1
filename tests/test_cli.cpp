#include <gtest/gtest.h>

#include "app/cli.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace whispercore;

namespace {

int run(const std::vector<std::string>& args) {
    static const std::atomic<bool> no_stop{false};
    return run_cli(args, no_stop);
}

} // namespace

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

TEST(CliArgs, ParsesEngineOverrides) {
    const auto a = parse_cli_args({"-m", "/models/base.bin", "--gpu", "disabled", "--gpu-device", "2",
                                   "--no-flash-attn", "-t", "4", "-l", "de", "--translate", "in.wav"});
    EXPECT_EQ(a.model_path.value_or(""), "/models/base.bin");
    EXPECT_EQ(a.engine.gpu_mode, GpuMode::Disabled);
    EXPECT_EQ(a.engine.gpu_device, 2);
    EXPECT_EQ(a.engine.flash_attention, false);
    EXPECT_EQ(a.engine.threads, 4);
    EXPECT_EQ(a.engine.language.value_or(""), "de");
    EXPECT_EQ(a.engine.translate, true);
    EXPECT_EQ(a.audio_path.value_or(""), "in.wav");
}

TEST(CliArgs, UnsetOptionsStayUnset) {
    const auto a = parse_cli_args({"in.wav"});
    EXPECT_FALSE(a.engine.gpu_mode);
    EXPECT_FALSE(a.engine.threads);
    EXPECT_FALSE(a.record_seconds);
    EXPECT_FALSE(a.help);
}

TEST(CliArgs, RejectsBadInput) {
    EXPECT_THROW(parse_cli_args({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse_cli_args({"--threads"}), std::invalid_argument);
    EXPECT_THROW(parse_cli_args({"--threads", "four"}), std::invalid_argument);
    EXPECT_THROW(parse_cli_args({"--record", "5s"}), std::invalid_argument);
    EXPECT_THROW(parse_cli_args({"--gpu", "sometimes"}), std::invalid_argument);
}

// =============================================================================
// EXIT CODES
// =============================================================================

TEST(CliExitCodes, Values) {
    EXPECT_EQ(kExitSuccess, 0);
    EXPECT_EQ(kExitFailure, 1);
}

TEST(CliExitCodes, HelpSucceeds) {
    EXPECT_EQ(run({"--help"}), 0);
}

TEST(CliExitCodes, UnknownOptionFails) {
    EXPECT_EQ(run({"--bogus"}), 1);
    EXPECT_EQ(run({"--threads", "x", "in.wav"}), 1);
}

TEST(CliExitCodes, MissingInputFails) {
    EXPECT_EQ(run({"--no-db", "--config", "/nonexistent/whispercore.toml"}), 1);
}

TEST(CliExitCodes, HistoryWithoutDbFails) {
    EXPECT_EQ(run({"--no-db", "--history", "5", "--config", "/nonexistent/whispercore.toml"}), 1);
}

TEST(CliExitCodes, MissingModelFails) {
    EXPECT_EQ(run({"--no-db", "--config", "/nonexistent/whispercore.toml",
                   "-m", "/nonexistent/ggml-base.bin", "in.wav"}), 1);
}
