#include <gtest/gtest.h>

#include "audio/audio_file.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace whispercore;

namespace {

std::filesystem::path temp_wav(const std::string& tag) {
    return std::filesystem::temp_directory_path() /
           ("whispercore-audio-" + tag + "-" + std::to_string(::getpid()) + ".wav");
}

} // namespace

TEST(AudioFile, DownmixAveragesChannels) {
    const std::vector<float> stereo = {1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f};
    const auto mono = downmix_to_mono(stereo, 2);
    ASSERT_EQ(mono.size(), 3u);
    EXPECT_FLOAT_EQ(mono[0], 0.5f);
    EXPECT_FLOAT_EQ(mono[1], 0.5f);
    EXPECT_FLOAT_EQ(mono[2], 0.0f);
}

TEST(AudioFile, DownmixMonoIsIdentity) {
    const std::vector<float> in = {0.1f, 0.2f};
    EXPECT_EQ(downmix_to_mono(in, 1), in);
}

TEST(AudioFile, ResampleLength) {
    const std::vector<float> in(44100, 0.0f);
    EXPECT_EQ(resample_linear(in, 44100, 16000).size(), 16000u);
    EXPECT_EQ(resample_linear(std::vector<float>(8000, 0.0f), 8000, 16000).size(), 16000u);
    EXPECT_EQ(resample_linear(in, 16000, 16000).size(), in.size());
}

TEST(AudioFile, ResamplePreservesConstantSignal) {
    const auto out = resample_linear(std::vector<float>(4800, 0.25f), 48000, 16000);
    ASSERT_EQ(out.size(), 1600u);
    for (float s : out) EXPECT_NEAR(s, 0.25f, 1e-6f);
}

TEST(AudioFile, WriteThenLoadAtEngineRate) {
    const auto path = temp_wav("roundtrip");
    std::vector<float> samples(16000);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        samples[i] = 0.5f * std::sin(2.0f * 3.14159265f * 220.0f * static_cast<float>(i) / 16000.0f);
    }
    ASSERT_TRUE(write_wav_file(path.string(), samples, 16000));

    auto loaded = load_audio_file(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.ok());
    ASSERT_EQ(loaded->size(), samples.size());
    // 16-bit quantization
    for (std::size_t i = 0; i < samples.size(); i += 997) {
        EXPECT_NEAR((*loaded)[i], samples[i], 1e-3f);
    }
}

TEST(AudioFile, LoadResamplesToTarget) {
    const auto path = temp_wav("resample");
    ASSERT_TRUE(write_wav_file(path.string(), std::vector<float>(22050, 0.0f), 22050));
    auto loaded = load_audio_file(path.string(), 16000);
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded->size(), 16000u);
}

TEST(AudioFile, MissingFileIsInvalidAudioData) {
    auto r = load_audio_file("/nonexistent/whispercore/none.wav");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidAudioData);
}

TEST(AudioFile, GarbageFileIsInvalidAudioData) {
    const auto path = temp_wav("garbage");
    {
        std::ofstream(path) << "not audio at all";
    }
    auto r = load_audio_file(path.string());
    std::filesystem::remove(path);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidAudioData);
}
