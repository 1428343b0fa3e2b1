#include <gtest/gtest.h>

#include "core/types.hpp"

#include <cmath>
#include <limits>

using namespace whispercore;

TEST(Timestamp, Formats) {
    EXPECT_EQ(format_timestamp(0.0), "00:00.00");
    EXPECT_EQ(format_timestamp(65.5), "01:05.50");
    EXPECT_EQ(format_timestamp(3.2), "00:03.20");
    EXPECT_EQ(format_timestamp(59.999), "01:00.00");
    EXPECT_EQ(format_timestamp(754.25), "12:34.25");
}

TEST(Timestamp, ClampsInvalidInput) {
    EXPECT_EQ(format_timestamp(-4.0), "00:00.00");
    EXPECT_EQ(format_timestamp(std::numeric_limits<double>::quiet_NaN()), "00:00.00");
}

TEST(Timestamp, Range) {
    Segment s{1.5, 3.25, "x", 1.0f};
    EXPECT_EQ(format_time_range(s), "00:01.50 - 00:03.25");
}

TEST(ResultJson, Shape) {
    TranscriptionResult r;
    r.text = "Hello world";
    r.segments.push_back({0.0, 1.5, "Hello world", 0.75f});
    r.language = "en";
    r.model_used = "whisper.cpp:base";
    r.used_gpu = true;

    const nlohmann::json j = r;
    EXPECT_EQ(j.at("text"), "Hello world");
    EXPECT_EQ(j.at("model"), "whisper.cpp:base");
    EXPECT_EQ(j.at("used_gpu"), true);
    EXPECT_EQ(j.at("language"), "en");
    ASSERT_EQ(j.at("segments").size(), 1u);
    EXPECT_DOUBLE_EQ(j["segments"][0].at("end").get<double>(), 1.5);
    EXPECT_FLOAT_EQ(j["segments"][0].at("confidence").get<float>(), 0.75f);

    const auto back = j.get<TranscriptionResult>();
    EXPECT_EQ(back.text, r.text);
    EXPECT_EQ(back.language, r.language);
    ASSERT_EQ(back.segments.size(), 1u);
    EXPECT_EQ(back.segments[0].text, "Hello world");
}

TEST(ResultJson, MissingLanguageIsNull) {
    TranscriptionResult r;
    const nlohmann::json j = r;
    EXPECT_TRUE(j.at("language").is_null());
    EXPECT_TRUE(j.at("segments").empty());
    EXPECT_FALSE(j.get<TranscriptionResult>().language.has_value());
}
