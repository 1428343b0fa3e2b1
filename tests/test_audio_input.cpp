#include <gtest/gtest.h>

#include "audio/audio_input.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace whispercore;

TEST(AudioInput, DefaultsToEngineFormat) {
    AudioParams p;
    EXPECT_DOUBLE_EQ(p.sample_rate, 16000.0);
    EXPECT_EQ(p.channels, 1u);
    EXPECT_FALSE(p.device_index.has_value());
}

// Fails before any audio is captured, with or without sound hardware.
TEST(AudioInput, RecordFromInvalidDeviceThrows) {
    AudioParams p;
    p.device_index = 99999;
    const std::atomic<bool> stop{false};
    EXPECT_THROW(record(p, std::chrono::milliseconds(10), stop), std::runtime_error);
}
