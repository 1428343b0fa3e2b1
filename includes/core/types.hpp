#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace whispercore {

// One decoded utterance span. Times are seconds from the start of the input.
struct Segment {
    double start_time{0.0};
    double end_time{0.0};
    std::string text;
    float confidence{0.0f};
};

struct TranscriptionResult {
    std::string text;
    std::vector<Segment> segments;
    std::optional<std::string> language;
    std::string model_used;
    bool used_gpu{false};
};

// "MM:SS.cc"
std::string format_timestamp(double seconds);
// "MM:SS.cc - MM:SS.cc"
std::string format_time_range(const Segment& segment);

void to_json(nlohmann::json& j, const Segment& s);
void from_json(const nlohmann::json& j, Segment& s);
void to_json(nlohmann::json& j, const TranscriptionResult& r);
void from_json(const nlohmann::json& j, TranscriptionResult& r);

} // namespace whispercore
