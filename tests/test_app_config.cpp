#include <gtest/gtest.h>

#include "app/app_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace whispercore;

namespace {

class ConfigFile {
public:
    explicit ConfigFile(const std::string& body) {
        path_ = std::filesystem::temp_directory_path() /
                ("whispercore-config-" + std::to_string(::getpid()) + ".toml");
        std::ofstream(path_) << body;
    }
    ~ConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST(AppConfig, MissingFileIsEmpty) {
    const auto cfg = load_config_file("/nonexistent/whispercore.toml");
    EXPECT_FALSE(cfg.model_path);
    EXPECT_FALSE(cfg.gpu_mode);
    EXPECT_FALSE(cfg.threads);
    EXPECT_FALSE(cfg.log_level);
}

TEST(AppConfig, ParsesKeys) {
    ConfigFile file(
        "# whispercore defaults\n"
        "model = \"/models/ggml-base.en.bin\"\n"
        "gpu_mode = required\n"
        "gpu_device: 1\n"
        "flash_attn = off   ; inline comment\n"
        "threads = 4\n"
        "language = 'de'\n"
        "translate = yes\n"
        "db_path = /tmp/wc.db\n"
        "input_device = 2\n"
        "log_level = debug\n"
        "unknown_key = 1\n");

    const auto cfg = load_config_file(file.path());
    EXPECT_EQ(cfg.model_path.value_or(""), "/models/ggml-base.en.bin");
    EXPECT_EQ(cfg.gpu_mode, GpuMode::Required);
    EXPECT_EQ(cfg.gpu_device, 1);
    EXPECT_EQ(cfg.flash_attention, false);
    EXPECT_EQ(cfg.threads, 4);
    EXPECT_EQ(cfg.language.value_or(""), "de");
    EXPECT_EQ(cfg.translate, true);
    EXPECT_EQ(cfg.db_path.value_or(""), "/tmp/wc.db");
    EXPECT_EQ(cfg.input_device, 2);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(AppConfig, InvalidValuesStayUnset) {
    ConfigFile file(
        "threads = four\n"
        "gpu_mode = sometimes\n"
        "translate = maybe\n"
        "gpu_device = 1x\n");
    const auto cfg = load_config_file(file.path());
    EXPECT_FALSE(cfg.threads);
    EXPECT_FALSE(cfg.gpu_mode);
    EXPECT_FALSE(cfg.translate);
    EXPECT_FALSE(cfg.gpu_device);
}

TEST(AppConfig, ApplyOverlaysOnlySetFields) {
    AppConfig app;
    app.gpu_mode = GpuMode::Disabled;
    app.threads = 8;

    Configuration c;
    app.apply_to(c);
    EXPECT_EQ(c.gpu_mode, GpuMode::Disabled);
    EXPECT_EQ(c.threads, 8);
    EXPECT_EQ(c.language, "auto");
    EXPECT_TRUE(c.flash_attention);
}

TEST(AppConfig, CommandLineOverridesFileOverridesDefaults) {
    ConfigFile file(
        "gpu_mode = disabled\n"
        "threads = 8\n");
    const auto file_cfg = load_config_file(file.path());

    EngineOverrides cli;
    cli.threads = 2;

    const Configuration c = resolve_configuration(file_cfg, cli);
    EXPECT_EQ(c.threads, 2);                    // command line
    EXPECT_EQ(c.gpu_mode, GpuMode::Disabled);   // file
    EXPECT_EQ(c.language, "auto");              // default
    EXPECT_TRUE(c.flash_attention);             // default
}

TEST(AppConfig, EmptySourcesGiveDefaults) {
    const Configuration c = resolve_configuration(AppConfig{}, EngineOverrides{});
    EXPECT_EQ(c.gpu_mode, GpuMode::Preferred);
    EXPECT_EQ(c.threads, 0);
    EXPECT_FALSE(c.translate);
}

TEST(AppConfig, ParsesSingleLines) {
    const auto kv = parse_config_line("  Model = \"/m/a.bin\"  # trailing");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "model");
    EXPECT_EQ(kv->second, "/m/a.bin");

    const auto colon = parse_config_line("threads: 3");
    ASSERT_TRUE(colon.has_value());
    EXPECT_EQ(colon->second, "3");

    EXPECT_FALSE(parse_config_line("").has_value());
    EXPECT_FALSE(parse_config_line("; comment only").has_value());
    EXPECT_FALSE(parse_config_line("no separator").has_value());
    EXPECT_FALSE(parse_config_line("key =").has_value());
}

TEST(AppConfig, ExpandsHome) {
    const char* home = std::getenv("HOME");
    if (!home) GTEST_SKIP() << "HOME not set";
    EXPECT_EQ(expand_path("~/models/a.bin"), std::string(home) + "/models/a.bin");
    EXPECT_EQ(expand_path("/abs/a.bin"), "/abs/a.bin");
}
