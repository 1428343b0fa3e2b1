#include "core/types.hpp"

#include <cmath>
#include <cstdio>

namespace whispercore {

std::string format_timestamp(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;

    const long long centis = std::llround(seconds * 100.0);
    const long long minutes = centis / 6000;
    const long long secs = (centis / 100) % 60;
    const long long cs = centis % 100;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%02lld", minutes, secs, cs);
    return buf;
}

std::string format_time_range(const Segment& segment) {
    return format_timestamp(segment.start_time) + " - " + format_timestamp(segment.end_time);
}

void to_json(nlohmann::json& j, const Segment& s) {
    j = nlohmann::json{
        {"start", s.start_time},
        {"end", s.end_time},
        {"text", s.text},
        {"confidence", s.confidence}
    };
}

void from_json(const nlohmann::json& j, Segment& s) {
    s.start_time = j.at("start").get<double>();
    s.end_time = j.at("end").get<double>();
    s.text = j.at("text").get<std::string>();
    s.confidence = j.value("confidence", 0.0f);
}

void to_json(nlohmann::json& j, const TranscriptionResult& r) {
    j = nlohmann::json{
        {"text", r.text},
        {"segments", r.segments},
        {"model", r.model_used},
        {"used_gpu", r.used_gpu}
    };
    if (r.language) {
        j["language"] = *r.language;
    } else {
        j["language"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, TranscriptionResult& r) {
    r.text = j.at("text").get<std::string>();
    r.segments = j.at("segments").get<std::vector<Segment>>();
    r.model_used = j.value("model", std::string{});
    r.used_gpu = j.value("used_gpu", false);
    if (j.contains("language") && j["language"].is_string()) {
        r.language = j["language"].get<std::string>();
    } else {
        r.language.reset();
    }
}

} // namespace whispercore
